#include <tokwh/Cl_Lists.hh>

#include <tokwh/Cl_util.hh>

using namespace tokwh;

Cl_Lists::~Cl_Lists() = default;

std::string
Cl_Lists::getName() const
{
    return "lists";
}

TWInterest
Cl_Lists::getInterest() const
{
    return {
        {"bullet_list_open",
         "bullet_list_close",
         "ordered_list_open",
         "ordered_list_close",
         "list_item_open",
         "inline"},
        {}};
}

void
Cl_Lists::onToken(
    size_t index, TWTokenView const& view, TWDispatchContext& ctx, TokenWarehouse& wh)
{
    auto const& type = view.type();
    if (type == "bullet_list_open" || type == "ordered_list_open") {
        // A list with no room for an item is not started.
        if (!ctx.admitItem(num_items)) {
            return;
        }
        List list;
        list.ordered = type == "ordered_list_open";
        list.depth = open.size();
        list.start_line = wh.lineOf(index);
        list.section = cl::section_of(wh, list.start_line);
        open.push_back(lists.size());
        lists.push_back(std::move(list));
        awaiting_text = false;
    } else if (type == "bullet_list_close" || type == "ordered_list_close") {
        if (!open.empty()) {
            open.pop_back();
        }
        awaiting_text = false;
    } else if (type == "list_item_open") {
        if (!open.empty() && ctx.admitItem(num_items)) {
            lists.at(open.back()).items.emplace_back();
            ++num_items;
            awaiting_text = true;
        }
    } else if (awaiting_text) {
        // The first inline token of the item is its text.
        lists.at(open.back()).items.back() = view.content();
        awaiting_text = false;
    }
}

JSON
Cl_Lists::finalize(TokenWarehouse&)
{
    auto result = JSON::makeDictionary();
    auto items = result.addDictionaryMember("items", JSON::makeArray());
    for (auto const& list: lists) {
        auto j = items.addArrayElement(JSON::makeDictionary());
        j.addDictionaryMember("ordered", JSON::makeBool(list.ordered));
        j.addDictionaryMember("depth", cl::size_json(list.depth));
        j.addDictionaryMember("start_line", cl::line_json(list.start_line));
        j.addDictionaryMember("section", cl::section_json(list.section));
        auto texts = j.addDictionaryMember("items", JSON::makeArray());
        for (auto const& text: list.items) {
            texts.addArrayElement(JSON::makeString(text));
        }
    }
    return result;
}

size_t
Cl_Lists::itemCount() const
{
    return num_items;
}
