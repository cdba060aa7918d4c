#include <tokwh/Cl_Headings.hh>

#include <tokwh/Cl_util.hh>
#include <tokwh/Util.hh>

using namespace tokwh;

Cl_Headings::~Cl_Headings() = default;

std::string
Cl_Headings::getName() const
{
    return "headings";
}

TWInterest
Cl_Headings::getInterest() const
{
    return {{"heading_open", "heading_close", "inline"}, {}};
}

void
Cl_Headings::onToken(
    size_t index, TWTokenView const& view, TWDispatchContext& ctx, TokenWarehouse& wh)
{
    auto const& type = view.type();
    if (type == "heading_open") {
        if (!ctx.admitItem(headings.size())) {
            return;
        }
        Heading h;
        h.level = util::heading_level(view.tag());
        h.line = wh.lineOf(index);
        h.section = cl::section_of(wh, h.line);
        headings.push_back(std::move(h));
        in_heading = true;
    } else if (type == "heading_close") {
        in_heading = false;
    } else if (in_heading && !headings.empty()) {
        headings.back().text += view.content();
    }
}

JSON
Cl_Headings::finalize(TokenWarehouse&)
{
    auto result = JSON::makeDictionary();
    auto items = result.addDictionaryMember("items", JSON::makeArray());
    for (auto const& h: headings) {
        auto j = items.addArrayElement(JSON::makeDictionary());
        j.addDictionaryMember("level", JSON::makeInt(h.level));
        j.addDictionaryMember("text", JSON::makeString(h.text));
        j.addDictionaryMember("line", cl::line_json(h.line));
        j.addDictionaryMember("section", cl::section_json(h.section));
    }
    return result;
}

size_t
Cl_Headings::itemCount() const
{
    return headings.size();
}
