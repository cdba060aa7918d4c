#include <tokwh/assert_test.h>

#include "TestNode.hh"

#include <tokwh/TWExc.hh>
#include <tokwh/TokenWarehouse.hh>
#include <tokwh/global.hh>

#include <functional>
#include <iostream>

static std::shared_ptr<TWLogger>
quiet_logger()
{
    auto l = TWLogger::create();
    l->setWarn(l->discard());
    return l;
}

static void
expect_limit(std::function<void()> fn, std::string const& object)
{
    auto before = tokwh::global::limit_errors();
    try {
        fn();
        std::cout << "no limit error for " << object << "\n";
        assert(false);
    } catch (TWExc& e) {
        std::cout << "expected: " << e.what() << "\n";
        assert(e.getErrorCode() == tokwh_e_resource_limit);
        assert(e.getObject() == object);
    }
    assert(tokwh::global::limit_errors() == before + 1);
}

static void
test_token_count()
{
    // One shared node is enough; it must not be read at all.
    auto node = TestNode::make("text");
    std::vector<std::shared_ptr<TWRawNode>> nodes(600'000, node);
    TWConfig config;
    assert(config.getMaxTokens() == 500'000);
    expect_limit([&]() { TokenWarehouse wh(nodes, config); }, "token count");
    assert(node->reads == 0);

    std::vector<TWTokenView> views(11, TWTokenView("text", 0, "", {}, {}, "", {}));
    config.setMaxTokens(10);
    expect_limit([&]() { TokenWarehouse wh(views, config); }, "token count");
    views.pop_back();
    TokenWarehouse ok(views, config);
    assert(ok.getTokens().size() == 10);
}

static void
test_bytes()
{
    TWConfig config;
    config.setMaxBytes(1024);
    std::vector<TWTokenView> small{TWTokenView("text", 0, "", {}, {}, "x", {})};
    expect_limit([&]() { TokenWarehouse wh(small, config, std::string(1025, 'a')); },
                 "document size");
    TokenWarehouse exact(small, config, std::string(1024, 'a'));

    // Field sizes count even without source text.
    std::vector<TWTokenView> big{
        TWTokenView("text", 0, "", {}, {}, std::string(600, 'b'), {}),
        TWTokenView("link_open", 1, "a", {}, {}, "", std::string(600, 'c'))};
    expect_limit([&]() { TokenWarehouse wh(big, config); }, "document size");

    // Token count is checked first.
    config.setMaxTokens(1);
    expect_limit([&]() { TokenWarehouse wh(big, config); }, "token count");
}

static void
test_nesting()
{
    TWConfig config;
    config.setMaxNesting(3);
    auto log = quiet_logger();

    std::vector<std::shared_ptr<TWRawNode>> nodes;
    for (int i = 0; i < 4; ++i) {
        nodes.push_back(TestNode::make("blockquote_open", 1));
    }
    expect_limit([&]() { TokenWarehouse wh(nodes, config, "", log); }, "nesting depth");
    nodes.pop_back();
    {
        TokenWarehouse wh(nodes, config, "", log);
    }

    // Open depth and child level add up.
    auto inl = TestNode::make("inline");
    inl->children_ = {TestNode::make("text")};
    nodes.push_back(inl);
    expect_limit([&]() { TokenWarehouse wh(nodes, config, "", log); }, "nesting depth");

    // Closed blocks do not count.
    std::vector<std::shared_ptr<TWRawNode>> flat;
    for (int i = 0; i < 10; ++i) {
        flat.push_back(TestNode::make("blockquote_open", 1));
        flat.push_back(TestNode::make("blockquote_close", -1));
    }
    TokenWarehouse wh(flat, config, "", log);
    assert(wh.pairOf(0) == 1u);
}

int
main()
{
    test_token_count();
    test_bytes();
    test_nesting();
    std::cout << "limits tests done" << std::endl;
    return 0;
}
