#include <tokwh/TWJSONNode.hh>

#include <tokwh/TWExc.hh>

#include <stdexcept>

TWJSONNode::TWJSONNode(JSON token) :
    token(std::move(token))
{
}

TWJSONNode::~TWJSONNode() = default;

std::vector<std::shared_ptr<TWRawNode>>
TWJSONNode::fromDocument(JSON const& document)
{
    auto tokens = document;
    if (document.isDictionary()) {
        tokens = document.getDictItem("tokens");
    }
    if (!tokens.isArray()) {
        throw TWExc(
            tokwh_e_json,
            "",
            "token dump",
            -1,
            "expected an array of tokens or a dictionary with a \"tokens\" array");
    }
    std::vector<std::shared_ptr<TWRawNode>> result;
    result.reserve(tokens.size());
    tokens.forEachArrayItem(
        [&result](JSON item) { result.push_back(std::make_shared<TWJSONNode>(item)); });
    return result;
}

std::vector<std::shared_ptr<TWRawNode>>
TWJSONNode::parseDocument(std::string const& text)
{
    JSON document;
    try {
        document = JSON::parse(text);
    } catch (std::runtime_error& e) {
        throw TWExc(tokwh_e_json, "", "token dump", -1, e.what());
    }
    return fromDocument(document);
}

std::string
TWJSONNode::getStringField(std::string const& key) const
{
    auto value = token.getDictItem(key);
    if (value.isNull()) {
        return "";
    }
    std::string result;
    if (!value.getString(result)) {
        throw std::runtime_error("token field " + key + " is not a string");
    }
    return result;
}

std::string
TWJSONNode::type() const
{
    return getStringField("type");
}

int
TWJSONNode::nesting() const
{
    auto value = token.getDictItem("nesting");
    if (value.isNull()) {
        return 0;
    }
    long long n = 0;
    if (!value.getInt(n)) {
        throw std::runtime_error("token field nesting is not an integer");
    }
    return n < 0 ? -1 : (n > 0 ? 1 : 0);
}

std::optional<std::pair<long long, long long>>
TWJSONNode::map() const
{
    auto value = token.getDictItem("map");
    if (value.isNull()) {
        return std::nullopt;
    }
    std::vector<long long> bounds;
    bool ok = value.isArray() && value.size() == 2;
    if (ok) {
        value.forEachArrayItem([&ok, &bounds](JSON item) {
            long long n = 0;
            if (item.getInt(n)) {
                bounds.push_back(n);
            } else {
                ok = false;
            }
        });
    }
    if (!ok) {
        throw std::runtime_error("token field map is not a pair of integers");
    }
    return std::make_pair(bounds.at(0), bounds.at(1));
}

std::string
TWJSONNode::tag() const
{
    return getStringField("tag");
}

std::optional<std::string>
TWJSONNode::info() const
{
    if (token.getDictItem("info").isNull()) {
        return std::nullopt;
    }
    return getStringField("info");
}

std::string
TWJSONNode::content() const
{
    return getStringField("content");
}

std::optional<std::string>
TWJSONNode::attrGet(std::string const& name) const
{
    auto attrs = token.getDictItem("attrs");
    if (attrs.isNull()) {
        return std::nullopt;
    }
    std::optional<std::string> result;
    if (attrs.isDictionary()) {
        auto value = attrs.getDictItem(name);
        if (!value.isNull()) {
            std::string s;
            if (!value.getString(s)) {
                throw std::runtime_error("attribute " + name + " is not a string");
            }
            result = s;
        }
        return result;
    }
    if (!attrs.isArray()) {
        throw std::runtime_error("token field attrs is neither a list nor a dictionary");
    }
    bool ok = true;
    attrs.forEachArrayItem([&](JSON pair) {
        std::vector<std::string> kv;
        if (pair.isArray() && pair.size() == 2) {
            pair.forEachArrayItem([&kv](JSON item) {
                std::string s;
                if (item.getString(s)) {
                    kv.push_back(s);
                }
            });
        }
        if (kv.size() != 2) {
            ok = false;
        } else if (kv[0] == name && !result) {
            result = kv[1];
        }
    });
    if (!ok) {
        throw std::runtime_error("token field attrs contains an entry that is not a string pair");
    }
    return result;
}

std::vector<std::shared_ptr<TWRawNode>>
TWJSONNode::children() const
{
    auto value = token.getDictItem("children");
    std::vector<std::shared_ptr<TWRawNode>> result;
    if (value.isNull()) {
        return result;
    }
    if (!value.isArray()) {
        throw std::runtime_error("token field children is not a list");
    }
    value.forEachArrayItem(
        [&result](JSON item) { result.push_back(std::make_shared<TWJSONNode>(item)); });
    return result;
}
