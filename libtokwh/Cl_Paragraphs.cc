#include <tokwh/Cl_Paragraphs.hh>

#include <tokwh/Cl_util.hh>

using namespace tokwh;

Cl_Paragraphs::~Cl_Paragraphs() = default;

std::string
Cl_Paragraphs::getName() const
{
    return "paragraphs";
}

TWInterest
Cl_Paragraphs::getInterest() const
{
    return {{"paragraph_open", "paragraph_close", "inline"}, {}};
}

void
Cl_Paragraphs::onToken(
    size_t index, TWTokenView const& view, TWDispatchContext& ctx, TokenWarehouse& wh)
{
    auto const& type = view.type();
    if (type == "paragraph_open") {
        in_paragraph = false;
        if (!ctx.admitItem(paragraphs.size())) {
            return;
        }
        Paragraph p;
        p.line = wh.lineOf(index);
        p.section = cl::section_of(wh, p.line);
        paragraphs.push_back(std::move(p));
        in_paragraph = true;
    } else if (type == "paragraph_close") {
        in_paragraph = false;
    } else if (in_paragraph) {
        paragraphs.back().text += view.content();
    }
}

JSON
Cl_Paragraphs::finalize(TokenWarehouse&)
{
    auto result = JSON::makeDictionary();
    auto items = result.addDictionaryMember("items", JSON::makeArray());
    for (auto const& p: paragraphs) {
        auto j = items.addArrayElement(JSON::makeDictionary());
        j.addDictionaryMember("text", JSON::makeString(p.text));
        j.addDictionaryMember("line", cl::line_json(p.line));
        j.addDictionaryMember("section", cl::section_json(p.section));
    }
    return result;
}

size_t
Cl_Paragraphs::itemCount() const
{
    return paragraphs.size();
}
