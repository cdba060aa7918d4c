#include <tokwh/Cl_Images.hh>

#include <tokwh/Cl_util.hh>
#include <tokwh/TWURL.hh>

using namespace tokwh;

Cl_Images::Cl_Images(std::set<std::string> allowed_schemes, bool allow_relative) :
    allowed_schemes(std::move(allowed_schemes)),
    allow_relative(allow_relative)
{
}

Cl_Images::Cl_Images(TWConfig const& config) :
    Cl_Images(config.getAllowedSchemes(), config.getAllowRelativeUrls())
{
}

Cl_Images::~Cl_Images() = default;

std::string
Cl_Images::getName() const
{
    return "images";
}

TWInterest
Cl_Images::getInterest() const
{
    return {{"image"}, {"fence", "code_block"}};
}

void
Cl_Images::onToken(
    size_t index, TWTokenView const& view, TWDispatchContext& ctx, TokenWarehouse& wh)
{
    if (!ctx.admitItem(images.size())) {
        return;
    }
    Image image;
    image.src = view.src().value_or("");
    if (auto r = TWURL::tryNormalize(image.src, allowed_schemes, allow_relative)) {
        image.normalized = r->normalized;
        image.allowed = r->allowed;
    }
    // markdown-it stores the alt text as the image token's content.
    image.alt = view.content();
    image.title = view.title();
    image.line = wh.lineOf(index);
    image.section = cl::section_of(wh, image.line);
    images.push_back(std::move(image));
}

JSON
Cl_Images::finalize(TokenWarehouse&)
{
    auto result = JSON::makeDictionary();
    auto items = result.addDictionaryMember("items", JSON::makeArray());
    for (auto const& image: images) {
        auto j = items.addArrayElement(JSON::makeDictionary());
        j.addDictionaryMember("src", JSON::makeString(image.src));
        j.addDictionaryMember("normalized", cl::string_json(image.normalized));
        j.addDictionaryMember("allowed", JSON::makeBool(image.allowed));
        j.addDictionaryMember("alt", JSON::makeString(image.alt));
        j.addDictionaryMember("title", cl::string_json(image.title));
        j.addDictionaryMember("line", cl::line_json(image.line));
        j.addDictionaryMember("section", cl::section_json(image.section));
    }
    return result;
}

size_t
Cl_Images::itemCount() const
{
    return images.size();
}
