#include <tokwh/TWCanonicalizer.hh>

#include <tokwh/TWIntC.hh>
#include <tokwh/global_private.hh>

#include <stdexcept>

using namespace tokwh;

namespace
{
    // Call one accessor. Anything it throws is reported and replaced by the default value.
    template <typename T, typename F>
    T
    read_field(
        F accessor,
        T const& default_value,
        char const* field,
        long long position,
        TWCanonicalizer::warning_fn_t const& warn)
    {
        std::string problem;
        try {
            return accessor();
        } catch (std::exception& e) {
            problem = e.what();
        } catch (...) {
            problem = "unknown exception";
        }
        if (warn) {
            warn(TWExc(
                tokwh_e_malformed_node,
                "",
                std::string("node field ") + field,
                position,
                "accessor failed (" + problem + "); using default value"));
        }
        return default_value;
    }

    TWExc
    limit_exceeded(std::string const& what, size_t limit)
    {
        global::Limits::error();
        return {
            tokwh_e_resource_limit,
            "",
            what,
            -1,
            "document exceeds limit of " + std::to_string(limit)};
    }

    // One level of the flattening walk. The top level refers to the caller's vector; nested
    // levels own the children returned by their parent node.
    struct Frame
    {
        std::vector<std::shared_ptr<TWRawNode>> const*
        nodes() const
        {
            return external ? external : &owned;
        }

        std::vector<std::shared_ptr<TWRawNode>> const* external;
        std::vector<std::shared_ptr<TWRawNode>> owned;
        size_t next;
        size_t parent;
        size_t level;
    };
} // namespace

TWTokenView
TWCanonicalizer::canonicalize(
    std::shared_ptr<TWRawNode> const& node, warning_fn_t const& warn, long long position)
{
    return canonicalizeNode(node, warn, position, nullptr);
}

TWTokenView
TWCanonicalizer::canonicalizeNode(
    std::shared_ptr<TWRawNode> const& node,
    warning_fn_t const& warn,
    long long position,
    std::vector<std::shared_ptr<TWRawNode>>* children)
{
    if (!node) {
        throw TWExc(tokwh_e_malformed_node, "", "node", position, "null node");
    }
    auto const& n = *node;
    typedef std::optional<std::string> opt_string;
    typedef std::optional<std::pair<long long, long long>> opt_map;

    TWTokenView view;
    view.type_ = read_field([&n]() { return n.type(); }, std::string(), "type", position, warn);
    auto nesting = read_field([&n]() { return n.nesting(); }, 0, "nesting", position, warn);
    view.nesting_ = nesting < 0 ? -1 : (nesting > 0 ? 1 : 0);
    view.tag_ = read_field([&n]() { return n.tag(); }, std::string(), "tag", position, warn);
    auto map = read_field([&n]() { return n.map(); }, opt_map(), "map", position, warn);
    if (map) {
        view.map_ = TWTokenView::clampMap(map->first, map->second);
    }
    view.info_ = read_field([&n]() { return n.info(); }, opt_string(), "info", position, warn);
    view.content_ =
        read_field([&n]() { return n.content(); }, std::string(), "content", position, warn);
    view.href_ =
        read_field([&n]() { return n.attrGet("href"); }, opt_string(), "href", position, warn);
    view.src_ =
        read_field([&n]() { return n.attrGet("src"); }, opt_string(), "src", position, warn);
    view.title_ =
        read_field([&n]() { return n.attrGet("title"); }, opt_string(), "title", position, warn);
    if (children) {
        *children = read_field(
            [&n]() { return n.children(); },
            std::vector<std::shared_ptr<TWRawNode>>(),
            "children",
            position,
            warn);
    }
    return view;
}

std::vector<TWTokenView>
TWCanonicalizer::flatten(
    std::vector<std::shared_ptr<TWRawNode>> const& nodes,
    size_t max_tokens,
    size_t max_nesting,
    warning_fn_t const& warn)
{
    static size_t constexpr none = static_cast<size_t>(-1);

    if (nodes.size() > max_tokens) {
        throw limit_exceeded("token count", max_tokens);
    }

    std::vector<TWTokenView> views;
    views.reserve(nodes.size());
    std::vector<Frame> stack;
    stack.push_back({&nodes, {}, 0, none, 0});

    while (!stack.empty()) {
        auto& top = stack.back();
        if (top.next == top.nodes()->size()) {
            if (top.parent != none) {
                views.at(top.parent).descendants_ = views.size() - top.parent - 1;
            }
            stack.pop_back();
            continue;
        }
        auto node = top.nodes()->at(top.next++);
        auto level = top.level;
        if (views.size() >= max_tokens) {
            throw limit_exceeded("token count", max_tokens);
        }
        std::vector<std::shared_ptr<TWRawNode>> children;
        auto position = TWIntC::to_longlong(views.size());
        views.push_back(canonicalizeNode(node, warn, position, &children));
        views.back().level_ = level;
        if (!children.empty()) {
            if (level + 1 > max_nesting) {
                throw limit_exceeded("nesting depth", max_nesting);
            }
            // top is invalidated by this push
            stack.push_back({nullptr, std::move(children), 0, views.size() - 1, level + 1});
        }
    }
    return views;
}
