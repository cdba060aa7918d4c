#include <tokwh/Cl_Links.hh>

#include <tokwh/Cl_util.hh>
#include <tokwh/TWURL.hh>

using namespace tokwh;

Cl_Links::Cl_Links(std::set<std::string> allowed_schemes, bool allow_relative) :
    allowed_schemes(std::move(allowed_schemes)),
    allow_relative(allow_relative)
{
}

Cl_Links::Cl_Links(TWConfig const& config) :
    Cl_Links(config.getAllowedSchemes(), config.getAllowRelativeUrls())
{
}

Cl_Links::~Cl_Links() = default;

std::string
Cl_Links::getName() const
{
    return "links";
}

TWInterest
Cl_Links::getInterest() const
{
    return {{"link_open", "link_close", "text", "code_inline"}, {"fence", "code_block"}};
}

void
Cl_Links::onToken(
    size_t index, TWTokenView const& view, TWDispatchContext& ctx, TokenWarehouse& wh)
{
    auto const& type = view.type();
    if (type == "link_open") {
        if (depth++ > 0 || !ctx.admitItem(links.size())) {
            return;
        }
        Link link;
        link.url = view.href().value_or("");
        if (auto r = TWURL::tryNormalize(link.url, allowed_schemes, allow_relative)) {
            link.normalized = r->normalized;
            link.scheme = r->scheme;
            link.allowed = r->allowed;
        }
        link.line = wh.lineOf(index);
        link.section = cl::section_of(wh, link.line);
        links.push_back(std::move(link));
    } else if (type == "link_close") {
        if (depth > 0) {
            --depth;
        }
    } else if (depth > 0 && !links.empty()) {
        links.back().text += view.content();
    }
}

JSON
Cl_Links::finalize(TokenWarehouse&)
{
    auto result = JSON::makeDictionary();
    auto items = result.addDictionaryMember("items", JSON::makeArray());
    size_t id = 0;
    for (auto const& link: links) {
        auto j = items.addArrayElement(JSON::makeDictionary());
        j.addDictionaryMember("id", JSON::makeString("link_" + std::to_string(id++)));
        j.addDictionaryMember("url", JSON::makeString(link.url));
        j.addDictionaryMember("normalized", cl::string_json(link.normalized));
        j.addDictionaryMember("scheme", cl::string_json(link.scheme));
        j.addDictionaryMember("allowed", JSON::makeBool(link.allowed));
        j.addDictionaryMember("text", JSON::makeString(link.text));
        j.addDictionaryMember("line", cl::line_json(link.line));
        j.addDictionaryMember("section", cl::section_json(link.section));
    }
    return result;
}

size_t
Cl_Links::itemCount() const
{
    return links.size();
}
