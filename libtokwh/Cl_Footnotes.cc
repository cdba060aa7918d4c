#include <tokwh/Cl_Footnotes.hh>

#include <tokwh/Cl_util.hh>

using namespace tokwh;

Cl_Footnotes::~Cl_Footnotes() = default;

std::string
Cl_Footnotes::getName() const
{
    return "footnotes";
}

TWInterest
Cl_Footnotes::getInterest() const
{
    return {
        {"footnote_ref", "footnote_reference_open", "footnote_reference_close", "inline"},
        {"fence", "code_block"}};
}

void
Cl_Footnotes::onToken(
    size_t index, TWTokenView const& view, TWDispatchContext& ctx, TokenWarehouse& wh)
{
    auto const& type = view.type();
    if (type == "footnote_ref" || type == "footnote_reference_open") {
        if (!ctx.admitItem(notes.size())) {
            return;
        }
        Note note;
        note.line = wh.lineOf(index);
        note.section = cl::section_of(wh, note.line);
        if (type == "footnote_ref") {
            note.text = view.content();
            note.closed = true;
        } else {
            note.definition = true;
            open.push_back(notes.size());
        }
        notes.push_back(std::move(note));
    } else if (type == "footnote_reference_close") {
        if (!open.empty()) {
            notes.at(open.back()).closed = true;
            open.pop_back();
        }
    } else if (!open.empty()) {
        notes.at(open.back()).text += view.content();
    }
}

JSON
Cl_Footnotes::finalize(TokenWarehouse&)
{
    auto result = JSON::makeDictionary();
    auto items = result.addDictionaryMember("items", JSON::makeArray());
    for (auto const& note: notes) {
        auto j = items.addArrayElement(JSON::makeDictionary());
        j.addDictionaryMember(
            "kind", JSON::makeString(note.definition ? "definition" : "reference"));
        j.addDictionaryMember("text", JSON::makeString(note.text));
        j.addDictionaryMember("closed", JSON::makeBool(note.closed));
        j.addDictionaryMember("line", cl::line_json(note.line));
        j.addDictionaryMember("section", cl::section_json(note.section));
    }
    return result;
}

size_t
Cl_Footnotes::itemCount() const
{
    return notes.size();
}
