#include <tokwh/assert_test.h>

#include "TestNode.hh"

#include <tokwh/TWCanonicalizer.hh>
#include <tokwh/TWExc.hh>
#include <tokwh/global.hh>

#include <iostream>

static void
test_fields()
{
    auto n = TestNode::make("link_open", 1, std::make_pair(3LL, 5LL), "a", "");
    n->attrs["href"] = "https://example.com";
    n->attrs["title"] = "T";
    n->info_ = "unused";
    auto v = TWCanonicalizer::canonicalize(n);
    assert(v.type() == "link_open");
    assert(v.nesting() == 1);
    assert(v.tag() == "a");
    assert(v.map() == TWTokenView::LineRange({3, 5}));
    assert(v.info() == "unused");
    assert(v.href() == "https://example.com");
    assert(!v.src());
    assert(v.title() == "T");
    assert(v.level() == 0);
    assert(v.descendants() == 0);
    // Every accessor except children is read exactly once.
    assert(n->reads == 9);
}

static void
test_clamping()
{
    auto v = TWCanonicalizer::canonicalize(TestNode::make("x", 7, std::make_pair(-4LL, -1LL)));
    assert(v.nesting() == 1);
    assert(v.map() == TWTokenView::LineRange({0, 0}));
    v = TWCanonicalizer::canonicalize(TestNode::make("x", -9, std::make_pair(10LL, 2LL)));
    assert(v.nesting() == -1);
    assert(v.map() == TWTokenView::LineRange({10, 10}));
    v = TWCanonicalizer::canonicalize(TestNode::make("x", 0, std::make_pair(5LL, 1LL << 40)));
    assert(v.map() == TWTokenView::LineRange({5, TWTokenView::MAX_LINE}));
    assert(TWTokenView::clampMap(2'000'000, 3) == TWTokenView::LineRange({1'000'000, 1'000'000}));

    TWTokenView direct("y", 3, "", TWTokenView::LineRange{4, 1}, std::nullopt, "abc", "h");
    assert(direct.nesting() == 1);
    assert(direct.map() == TWTokenView::LineRange({4, 4}));
    assert(direct.byteSize() == 5);
}

static void
test_throwing_accessors()
{
    auto n = TestNode::make("heading_open", 1, std::make_pair(0LL, 1LL), "h1", "c");
    n->throwing = {"type", "map", "attr:href", "content", "children"};
    std::vector<TWExc> warnings;
    auto warn = [&warnings](TWExc const& e) { warnings.push_back(e); };
    auto views = TWCanonicalizer::flatten({n}, 10, 10, warn);
    assert(views.size() == 1);
    auto const& v = views.at(0);
    assert(v.type().empty());
    assert(v.nesting() == 1);
    assert(!v.map());
    assert(v.content().empty());
    assert(!v.href());
    assert(v.tag() == "h1");
    assert(warnings.size() == 5);
    for (auto const& w: warnings) {
        assert(w.getErrorCode() == tokwh_e_malformed_node);
        assert(w.getPosition() == 0);
    }
    assert(warnings.at(0).getObject() == "node field type");
    assert(n->reads == 10);

    // Without a callback faults are silently defaulted.
    auto v2 = TWCanonicalizer::canonicalize(n);
    assert(v2.type().empty());

    try {
        TWCanonicalizer::canonicalize(nullptr);
        assert(false);
    } catch (TWExc& e) {
        assert(e.getErrorCode() == tokwh_e_malformed_node);
    }
    try {
        TWCanonicalizer::flatten({TestNode::make("a"), nullptr}, 10, 10);
        assert(false);
    } catch (TWExc& e) {
        assert(e.getErrorCode() == tokwh_e_malformed_node);
        assert(e.getPosition() == 1);
    }
}

static void
test_flatten()
{
    // p1 [ c1 [ g1 g2 ] c2 ] p2
    auto p1 = TestNode::make("inline");
    auto c1 = TestNode::make("link_open", 1);
    auto c2 = TestNode::make("text", 0, std::nullopt, "", "c2");
    auto g1 = TestNode::make("text", 0, std::nullopt, "", "g1");
    auto g2 = TestNode::make("text", 0, std::nullopt, "", "g2");
    auto p2 = TestNode::make("paragraph_close", -1);
    c1->children_ = {g1, g2};
    p1->children_ = {c1, c2};
    auto views = TWCanonicalizer::flatten({p1, p2}, 100, 10);
    assert(views.size() == 6);
    std::vector<std::string> order;
    for (auto const& v: views) {
        order.push_back(v.type() + "/" + v.content());
    }
    assert(
        order ==
        std::vector<std::string>(
            {"inline/", "link_open/", "text/g1", "text/g2", "text/c2", "paragraph_close/"}));
    assert(views.at(0).level() == 0 && views.at(0).descendants() == 4);
    assert(views.at(1).level() == 1 && views.at(1).descendants() == 2);
    assert(views.at(2).level() == 2 && views.at(2).descendants() == 0);
    assert(views.at(4).level() == 1);
    assert(views.at(5).level() == 0 && views.at(5).descendants() == 0);
}

static void
test_limits()
{
    auto errors = tokwh::global::limit_errors();

    // A node that contains itself is bounded by the nesting limit.
    auto loop = TestNode::make("inline");
    loop->children_ = {loop};
    try {
        TWCanonicalizer::flatten({loop}, 1'000'000, 50);
        assert(false);
    } catch (TWExc& e) {
        assert(e.getErrorCode() == tokwh_e_resource_limit);
        assert(e.getObject() == "nesting depth");
    }
    // Break the cycle so the node can be freed.
    loop->children_.clear();

    // Wide children are bounded by the token limit.
    auto wide = TestNode::make("inline");
    for (int i = 0; i < 20; ++i) {
        wide->children_.push_back(TestNode::make("text"));
    }
    try {
        TWCanonicalizer::flatten({wide}, 10, 50);
        assert(false);
    } catch (TWExc& e) {
        assert(e.getErrorCode() == tokwh_e_resource_limit);
        assert(e.getObject() == "token count");
    }
    try {
        TWCanonicalizer::flatten({wide, wide}, 1, 50);
        assert(false);
    } catch (TWExc& e) {
        assert(e.getObject() == "token count");
    }
    assert(TWCanonicalizer::flatten({wide}, 21, 1).size() == 21);
    assert(tokwh::global::limit_errors() == errors + 3);
}

int
main()
{
    test_fields();
    test_clamping();
    test_throwing_accessors();
    test_flatten();
    test_limits();
    std::cout << "canonicalize tests done" << std::endl;
    return 0;
}
