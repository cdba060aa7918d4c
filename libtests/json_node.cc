#include <tokwh/assert_test.h>

#include <tokwh/TWCanonicalizer.hh>
#include <tokwh/TWExc.hh>
#include <tokwh/TWJSONNode.hh>
#include <tokwh/TokenWarehouse.hh>

#include <functional>
#include <iostream>

static char const* dump = R"({"tokens": [
  {"type": "heading_open", "tag": "h1", "nesting": 1, "map": [0, 1]},
  {"type": "inline", "tag": "", "nesting": 0, "map": [0, 1], "content": "Hello",
   "children": [{"type": "text", "content": "Hello", "children": null}]},
  {"type": "heading_close", "tag": "h1", "nesting": -1, "map": null},
  {"type": "fence", "tag": "code", "nesting": 0, "map": [2, 5], "info": "c++",
   "content": "int x;\n", "attrs": null},
  {"type": "link_open", "nesting": 1, "attrs": [["href", "https://a.example"], ["title", "t"]]},
  {"type": "image", "attrs": {"src": "/img.png", "title": null}}
]})";

static void
test_accessors()
{
    auto nodes = TWJSONNode::parseDocument(dump);
    assert(nodes.size() == 6);
    auto const& h = *nodes.at(0);
    assert(h.type() == "heading_open");
    assert(h.tag() == "h1");
    assert(h.nesting() == 1);
    assert(h.map() == std::make_pair(0LL, 1LL));
    assert(!h.info());
    assert(h.content().empty());
    assert(!h.attrGet("href"));
    assert(h.children().empty());

    auto children = nodes.at(1)->children();
    assert(children.size() == 1);
    assert(children.at(0)->content() == "Hello");
    assert(children.at(0)->children().empty());

    assert(!nodes.at(2)->map());
    assert(nodes.at(3)->info() == "c++");
    assert(nodes.at(4)->attrGet("href") == "https://a.example");
    assert(nodes.at(4)->attrGet("title") == "t");
    assert(!nodes.at(4)->attrGet("src"));
    assert(nodes.at(5)->attrGet("src") == "/img.png");
    assert(!nodes.at(5)->attrGet("title"));
    assert(nodes.at(5)->nesting() == 0);
    assert(nodes.at(5)->tag().empty());

    // A bare array works too.
    assert(TWJSONNode::parseDocument(R"([{"type": "text"}])").size() == 1);
}

static void
test_wrong_types()
{
    auto node = std::make_shared<TWJSONNode>(JSON::parse(R"({
        "type": 7, "nesting": "1", "map": [1], "tag": "p", "content": ["x"],
        "attrs": [["href"]], "children": {}, "info": false})"));
    auto expect_throw = [](std::function<void()> fn) {
        try {
            fn();
            assert(false);
        } catch (std::runtime_error& e) {
            std::cout << "expected: " << e.what() << "\n";
        }
    };
    expect_throw([&]() { node->type(); });
    expect_throw([&]() { node->nesting(); });
    expect_throw([&]() { node->map(); });
    expect_throw([&]() { node->content(); });
    expect_throw([&]() { node->attrGet("href"); });
    expect_throw([&]() { node->children(); });
    expect_throw([&]() { node->info(); });
    assert(node->tag() == "p");

    // The canonicalizer turns each of these into a warning and a default value.
    size_t warnings = 0;
    auto view = TWCanonicalizer::canonicalize(
        node, [&warnings](TWExc const&) { ++warnings; });
    assert(warnings == 8);
    assert(view.type().empty());
    assert(view.tag() == "p");
    assert(view.nesting() == 0);

    auto big = TWJSONNode(JSON::parse(R"({"nesting": 12, "map": [5, 99999999999]})"));
    assert(big.nesting() == 1);
    assert(big.map() == std::make_pair(5LL, 99999999999LL));
}

static void
test_documents()
{
    for (auto bad: {"", "{", "42", R"({"tokens": 1})", R"({"other": []})"}) {
        try {
            TWJSONNode::parseDocument(bad);
            assert(false);
        } catch (TWExc& e) {
            assert(e.getErrorCode() == tokwh_e_json);
            std::cout << "expected: " << e.what() << "\n";
        }
    }

    // From dump to sections
    TokenWarehouse wh(TWJSONNode::parseDocument(dump));
    assert(wh.getTokens().size() == 7);
    assert(wh.getTokens().at(2).type() == "text");
    assert(wh.getTokens().at(2).level() == 1);
    assert(wh.getSections().size() == 1);
    assert(wh.getSections().at(0).title == "Hello");
    assert(wh.getFences().size() == 1);
    assert(wh.getFences().at(0).lang == "c++");
}

int
main()
{
    test_accessors();
    test_wrong_types();
    test_documents();
    std::cout << "json_node tests done" << std::endl;
    return 0;
}
