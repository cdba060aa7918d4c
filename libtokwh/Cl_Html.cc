#include <tokwh/Cl_Html.hh>

#include <tokwh/Cl_util.hh>

using namespace tokwh;

Cl_Html::Cl_Html(bool allow_raw_html) :
    allow_raw_html(allow_raw_html)
{
}

Cl_Html::Cl_Html(TWConfig const& config) :
    Cl_Html(config.getAllowRawHtml())
{
}

Cl_Html::~Cl_Html() = default;

std::string
Cl_Html::getName() const
{
    return "html";
}

TWInterest
Cl_Html::getInterest() const
{
    return {{"html_block", "html_inline"}, {}};
}

void
Cl_Html::onToken(
    size_t index, TWTokenView const& view, TWDispatchContext& ctx, TokenWarehouse& wh)
{
    if (!allow_raw_html) {
        ++dropped;
        return;
    }
    if (!ctx.admitItem(fragments.size())) {
        return;
    }
    fragments.push_back({view.type() == "html_block", view.content(), wh.lineOf(index)});
}

JSON
Cl_Html::finalize(TokenWarehouse&)
{
    auto result = JSON::makeDictionary();
    auto items = result.addDictionaryMember("items", JSON::makeArray());
    for (auto const& f: fragments) {
        auto j = items.addArrayElement(JSON::makeDictionary());
        j.addDictionaryMember("kind", JSON::makeString(f.block ? "block" : "inline"));
        j.addDictionaryMember("content", JSON::makeString(f.content));
        j.addDictionaryMember("line", cl::line_json(f.line));
        j.addDictionaryMember("needs_sanitization", JSON::makeBool(true));
    }
    result.addDictionaryMember("allowed", JSON::makeBool(allow_raw_html));
    result.addDictionaryMember("dropped", cl::size_json(dropped));
    return result;
}

size_t
Cl_Html::itemCount() const
{
    return fragments.size();
}
