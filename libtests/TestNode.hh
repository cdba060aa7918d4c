#ifndef TESTNODE_HH
#define TESTNODE_HH

#include <tokwh/TWRawNode.hh>

#include <map>
#include <set>
#include <stdexcept>

// Scriptable node for tests. Any accessor named in throwing throws std::runtime_error; reads
// counts accessor calls so tests can check that each one is called at most once.
class TestNode: public TWRawNode
{
  public:
    TestNode(
        std::string type = "",
        int nesting = 0,
        std::optional<std::pair<long long, long long>> map = std::nullopt,
        std::string tag = "",
        std::string content = "") :
        type_(std::move(type)),
        nesting_(nesting),
        map_(map),
        tag_(std::move(tag)),
        content_(std::move(content))
    {
    }
    ~TestNode() override = default;

    static std::shared_ptr<TestNode>
    make(
        std::string type,
        int nesting = 0,
        std::optional<std::pair<long long, long long>> map = std::nullopt,
        std::string tag = "",
        std::string content = "")
    {
        return std::make_shared<TestNode>(
            std::move(type), nesting, map, std::move(tag), std::move(content));
    }

    std::string
    type() const override
    {
        check("type");
        return type_;
    }
    int
    nesting() const override
    {
        check("nesting");
        return nesting_;
    }
    std::optional<std::pair<long long, long long>>
    map() const override
    {
        check("map");
        return map_;
    }
    std::string
    tag() const override
    {
        check("tag");
        return tag_;
    }
    std::optional<std::string>
    info() const override
    {
        check("info");
        return info_;
    }
    std::string
    content() const override
    {
        check("content");
        return content_;
    }
    std::optional<std::string>
    attrGet(std::string const& name) const override
    {
        check("attr:" + name);
        auto it = attrs.find(name);
        if (it == attrs.end()) {
            return std::nullopt;
        }
        return it->second;
    }
    std::vector<std::shared_ptr<TWRawNode>>
    children() const override
    {
        check("children");
        return children_;
    }

    std::string type_;
    int nesting_;
    std::optional<std::pair<long long, long long>> map_;
    std::string tag_;
    std::optional<std::string> info_;
    std::string content_;
    std::map<std::string, std::string> attrs;
    std::vector<std::shared_ptr<TWRawNode>> children_;
    std::set<std::string> throwing;
    mutable size_t reads{0};

  private:
    void
    check(std::string const& field) const
    {
        ++reads;
        if (throwing.contains(field)) {
            throw std::runtime_error("accessor " + field + " exploded");
        }
    }
};

#endif // TESTNODE_HH
