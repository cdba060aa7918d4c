#include <tokwh/Cl_Sections.hh>

#include <tokwh/Cl_util.hh>

using namespace tokwh;

Cl_Sections::~Cl_Sections() = default;

std::string
Cl_Sections::getName() const
{
    return "sections";
}

TWInterest
Cl_Sections::getInterest() const
{
    return {};
}

void
Cl_Sections::onToken(size_t, TWTokenView const&, TWDispatchContext&, TokenWarehouse&)
{
}

JSON
Cl_Sections::finalize(TokenWarehouse& wh)
{
    auto result = JSON::makeDictionary();
    auto items = result.addDictionaryMember("items", JSON::makeArray());
    auto const& sections = wh.getSections();
    for (size_t i = 0; i < sections.size(); ++i) {
        auto const& s = sections[i];
        auto j = items.addArrayElement(JSON::makeDictionary());
        j.addDictionaryMember("id", cl::size_json(i));
        j.addDictionaryMember(
            "heading", s.heading_index ? cl::size_json(*s.heading_index) : JSON::makeNull());
        j.addDictionaryMember("start_line", JSON::makeInt(s.start_line));
        j.addDictionaryMember("end_line", JSON::makeInt(s.end_line));
        j.addDictionaryMember("level", JSON::makeInt(s.level));
        j.addDictionaryMember("title", JSON::makeString(s.title));
    }
    count = sections.size();
    return result;
}

size_t
Cl_Sections::itemCount() const
{
    return count;
}
