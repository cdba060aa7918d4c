#include <tokwh/Cl_Math.hh>

#include <tokwh/Cl_util.hh>

using namespace tokwh;

Cl_Math::~Cl_Math() = default;

std::string
Cl_Math::getName() const
{
    return "math";
}

TWInterest
Cl_Math::getInterest() const
{
    return {{"math_inline", "math_block", "math_block_eqno"}, {"fence", "code_block"}};
}

void
Cl_Math::onToken(
    size_t index, TWTokenView const& view, TWDispatchContext& ctx, TokenWarehouse& wh)
{
    if (!ctx.admitItem(formulas.size())) {
        return;
    }
    Formula f;
    f.display = view.type() != "math_inline";
    f.content = view.content();
    f.line = wh.lineOf(index);
    f.section = cl::section_of(wh, f.line);
    formulas.push_back(std::move(f));
}

JSON
Cl_Math::finalize(TokenWarehouse&)
{
    auto result = JSON::makeDictionary();
    auto items = result.addDictionaryMember("items", JSON::makeArray());
    for (auto const& f: formulas) {
        auto j = items.addArrayElement(JSON::makeDictionary());
        j.addDictionaryMember("display", JSON::makeBool(f.display));
        j.addDictionaryMember("content", JSON::makeString(f.content));
        j.addDictionaryMember("line", cl::line_json(f.line));
        j.addDictionaryMember("section", cl::section_json(f.section));
    }
    return result;
}

size_t
Cl_Math::itemCount() const
{
    return formulas.size();
}
