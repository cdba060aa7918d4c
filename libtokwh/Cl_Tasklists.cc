#include <tokwh/Cl_Tasklists.hh>

#include <tokwh/Cl_util.hh>
#include <tokwh/TWUtil.hh>

using namespace tokwh;

Cl_Tasklists::~Cl_Tasklists() = default;

std::string
Cl_Tasklists::getName() const
{
    return "tasklists";
}

TWInterest
Cl_Tasklists::getInterest() const
{
    return {{"list_item_open", "inline"}, {}};
}

void
Cl_Tasklists::onToken(
    size_t index, TWTokenView const& view, TWDispatchContext& ctx, TokenWarehouse& wh)
{
    if (view.type() == "list_item_open") {
        awaiting_text = true;
        item_line = wh.lineOf(index);
        return;
    }
    if (!awaiting_text) {
        return;
    }
    awaiting_text = false;
    auto const& text = view.content();
    if (text.size() < 3 || text[0] != '[' || text[2] != ']' ||
        !(text[1] == ' ' || text[1] == 'x' || text[1] == 'X')) {
        return;
    }
    if (text.size() > 3 && !(text[3] == ' ' || text[3] == '\t')) {
        return;
    }
    if (!ctx.admitItem(tasks.size())) {
        return;
    }
    Task task;
    task.checked = text[1] != ' ';
    task.text = TWUtil::trim(text.substr(3));
    task.line = item_line ? item_line : wh.lineOf(index);
    task.section = cl::section_of(wh, task.line);
    tasks.push_back(std::move(task));
}

JSON
Cl_Tasklists::finalize(TokenWarehouse&)
{
    auto result = JSON::makeDictionary();
    auto items = result.addDictionaryMember("items", JSON::makeArray());
    for (auto const& task: tasks) {
        auto j = items.addArrayElement(JSON::makeDictionary());
        j.addDictionaryMember("checked", JSON::makeBool(task.checked));
        j.addDictionaryMember("text", JSON::makeString(task.text));
        j.addDictionaryMember("line", cl::line_json(task.line));
        j.addDictionaryMember("section", cl::section_json(task.section));
    }
    return result;
}

size_t
Cl_Tasklists::itemCount() const
{
    return tasks.size();
}
