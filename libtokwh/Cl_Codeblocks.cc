#include <tokwh/Cl_Codeblocks.hh>

#include <tokwh/Cl_util.hh>
#include <tokwh/TWUtil.hh>

using namespace tokwh;

Cl_Codeblocks::~Cl_Codeblocks() = default;

std::string
Cl_Codeblocks::getName() const
{
    return "codeblocks";
}

TWInterest
Cl_Codeblocks::getInterest() const
{
    return {{"fence", "code_block"}, {}};
}

void
Cl_Codeblocks::onToken(
    size_t index, TWTokenView const& view, TWDispatchContext& ctx, TokenWarehouse& wh)
{
    if (!ctx.admitItem(blocks.size())) {
        return;
    }
    Block b;
    b.fenced = view.type() == "fence";
    b.info = view.info().value_or("");
    auto words = TWUtil::split_string(TWUtil::trim(b.info), ' ', true);
    if (!words.empty()) {
        b.lang = words.front();
    }
    b.content = view.content();
    if (view.map()) {
        b.start_line = view.map()->start;
        b.end_line = view.map()->end;
    } else {
        b.start_line = b.end_line = wh.lineOf(index);
    }
    blocks.push_back(std::move(b));
}

JSON
Cl_Codeblocks::finalize(TokenWarehouse&)
{
    auto result = JSON::makeDictionary();
    auto items = result.addDictionaryMember("items", JSON::makeArray());
    for (auto const& b: blocks) {
        auto j = items.addArrayElement(JSON::makeDictionary());
        j.addDictionaryMember("kind", JSON::makeString(b.fenced ? "fence" : "indented"));
        j.addDictionaryMember("info", JSON::makeString(b.info));
        j.addDictionaryMember("lang", JSON::makeString(b.lang));
        j.addDictionaryMember("content", JSON::makeString(b.content));
        j.addDictionaryMember("start_line", cl::line_json(b.start_line));
        j.addDictionaryMember("end_line", cl::line_json(b.end_line));
    }
    return result;
}

size_t
Cl_Codeblocks::itemCount() const
{
    return blocks.size();
}
