#include <tokwh/assert_test.h>

#include "TestNode.hh"

#include <tokwh/TWExc.hh>
#include <tokwh/TokenWarehouse.hh>

#include <iostream>

namespace
{
    typedef std::pair<long long, long long> range;

    // a_open, then one node whose children are k times (c_open, z_close) followed by k a_close
    // tokens. None of the closes can pair: the only a_open is outside the children.
    std::vector<std::shared_ptr<TWRawNode>>
    unmatched_opens(size_t k)
    {
        auto c_open = TestNode::make("c_open", 1);
        auto z_close = TestNode::make("z_close", -1);
        auto a_close = TestNode::make("a_close", -1);
        auto holder = TestNode::make("inline");
        for (size_t i = 0; i < k; ++i) {
            holder->children_.push_back(c_open);
            holder->children_.push_back(z_close);
        }
        for (size_t i = 0; i < k; ++i) {
            holder->children_.push_back(a_close);
        }
        return {TestNode::make("a_open", 1), holder};
    }

    std::vector<std::shared_ptr<TWRawNode>>
    document()
    {
        auto title = TestNode::make("inline", 0, range(0, 1), "", "Title");
        title->children_ = {TestNode::make("text", 0, std::nullopt, "", "Title")};

        auto para = TestNode::make("inline", 0, range(2, 3), "", "see [x](u) now");
        para->children_ = {
            TestNode::make("link_open", 1, std::nullopt, "a"),
            TestNode::make("text", 0, std::nullopt, "", "x"),
            TestNode::make("link_close", -1, std::nullopt, "a"),
            TestNode::make("text", 0, std::nullopt, "", " now")};

        auto fence = TestNode::make("fence", 0, range(4, 7), "code", "print(1)\n");
        fence->info_ = "  python  extra";

        return {
            TestNode::make("heading_open", 1, range(0, 1), "h1"),           // 0
            title,                                                          // 1, 2
            TestNode::make("heading_close", -1, std::nullopt, "h1"),        // 3
            TestNode::make("paragraph_open", 1, range(2, 3), "p"),          // 4
            para,                                                           // 5 .. 9
            TestNode::make("paragraph_close", -1, std::nullopt, "p"),       // 10
            fence,                                                          // 11
            TestNode::make("bullet_list_open", 1, range(8, 10), "ul"),      // 12
            TestNode::make("list_item_open", 1, range(8, 9), "li"),         // 13
            TestNode::make("list_item_close", -1, std::nullopt, "li"),      // 14
            TestNode::make("bullet_list_close", -1, std::nullopt, "ul"),    // 15
            TestNode::make("paragraph_close", -1, std::nullopt, "p"),       // 16
        };
    }
} // namespace

static void
test_pairs_and_parents()
{
    TokenWarehouse wh(document());
    assert(wh.getTokens().size() == 17);

    assert(wh.pairOf(0) == 3u && wh.pairOf(3) == 0u);
    assert(wh.pairOf(4) == 10u && wh.pairOf(10) == 4u);
    assert(wh.pairOf(6) == 8u && wh.pairOf(8) == 6u);
    assert(wh.pairOf(12) == 15u && wh.pairOf(13) == 14u);
    assert(!wh.pairOf(1));
    assert(!wh.pairOf(11));
    assert(!wh.pairOf(16));
    assert(!wh.pairOf(1000));

    std::vector<std::optional<size_t>> parents;
    for (size_t i = 0; i < wh.getTokens().size(); ++i) {
        parents.push_back(wh.parentOf(i));
    }
    std::vector<std::optional<size_t>> expected{
        std::nullopt, 0, 1, std::nullopt, std::nullopt, 4, 5, 6, 5, 5,
        std::nullopt, std::nullopt, std::nullopt, 12, 12, std::nullopt, std::nullopt};
    assert(parents == expected);
    assert(!wh.parentOf(1000));
}

static void
test_lines()
{
    TokenWarehouse wh(document(), TWConfig(), "# Title\r\n\nsee [x](u) now\n");
    assert(wh.lineOf(0) == 0);
    assert(wh.lineOf(2) == 0);
    assert(wh.lineOf(7) == 2);
    assert(wh.lineOf(8) == 2);
    assert(wh.lineOf(10) == 2);
    assert(wh.lineOf(11) == 4);
    assert(wh.lineOf(14) == 8);
    assert(!wh.lineOf(16));
    assert(!wh.lineOf(17));

    assert(wh.lineText(0) == "# Title");
    assert(wh.lineText(1).empty());
    assert(wh.lineText(2) == "see [x](u) now");
    assert(wh.lineText(3).empty());
    assert(wh.lineText(-1).empty());
    // The list's map ends at line 10.
    assert(wh.lineCount() == 10);

    TokenWarehouse text_only(std::vector<TWTokenView>(), TWConfig(), "a\nb\nc");
    assert(text_only.lineCount() == 3);
    assert(text_only.lineText(2) == "c");
}

static void
test_by_type_and_fences()
{
    TokenWarehouse wh(document());
    assert(wh.byType("text") == std::vector<size_t>({2, 7, 9}));
    assert(wh.byType("paragraph_close") == std::vector<size_t>({10, 16}));
    assert(wh.byType("no_such_type").empty());

    auto const& fences = wh.getFences();
    assert(fences.size() == 1);
    auto const& f = fences.at(0);
    assert(f.token_index == 11);
    assert(f.start_line == 4 && f.end_line == 7);
    assert(f.info == "  python  extra");
    assert(f.lang == "python");
}

static void
test_container_boundary()
{
    // A close token among a node's children never pairs with an open outside them.
    auto inl = TestNode::make("inline", 0, range(0, 1));
    inl->children_ = {TestNode::make("paragraph_close", -1)};
    TokenWarehouse wh(std::vector<std::shared_ptr<TWRawNode>>{
        TestNode::make("paragraph_open", 1, range(0, 1)),
        inl,
        TestNode::make("paragraph_close", -1)});
    assert(!wh.pairOf(2));
    assert(wh.parentOf(2) == 1u);
    assert(wh.pairOf(0) == 3u);

    // Mismatched base names do not pair.
    std::vector<TWTokenView> views{
        TWTokenView("em_open", 1, "em", {}, {}, "", {}),
        TWTokenView("strong_close", -1, "strong", {}, {}, "", {}),
        TWTokenView("em_close", -1, "em", {}, {}, "", {})};
    TokenWarehouse wh2(views);
    assert(!wh2.pairOf(1));
    assert(wh2.parentOf(1) == 0u);
    assert(wh2.pairOf(0) == 2u);
}

static void
test_unmatched_opens()
{
    // A close abandons the unmatched opens above its partner.
    std::vector<TWTokenView> views{
        TWTokenView("a_open", 1, "", {}, {}, "", {}),
        TWTokenView("c_open", 1, "", {}, {}, "", {}),
        TWTokenView("a_close", -1, "", {}, {}, "", {}),
        TWTokenView("c_close", -1, "", {}, {}, "", {})};
    TokenWarehouse wh(views);
    assert(wh.pairOf(0) == 2u);
    assert(!wh.pairOf(1));
    assert(!wh.pairOf(3));
    assert(!wh.parentOf(3));

    size_t constexpr k = 5;
    auto nodes = unmatched_opens(k);
    TokenWarehouse small(nodes);
    assert(small.getTokens().size() == 2 + 3 * k);
    assert(!small.pairOf(0));
    for (size_t i = 2; i < small.getTokens().size(); ++i) {
        assert(!small.pairOf(i));
    }
    assert(small.parentOf(2) == 1u);
    assert(small.parentOf(3) == 2u);
    // The first a_close sits inside the last c_open.
    assert(small.parentOf(2 + 2 * k) == 2 * k);

    // Unmatched opens count toward the nesting limit: a_open, the child container and k
    // c_open frames.
    TWConfig config;
    config.setMaxNesting(k + 1);
    try {
        TokenWarehouse wh2(nodes, config);
        assert(false);
    } catch (TWExc& e) {
        assert(e.getErrorCode() == tokwh_e_resource_limit);
        assert(e.getObject() == "nesting depth");
    }
    config.setMaxNesting(k + 2);
    TokenWarehouse wh3(nodes, config);

    // The default limit rejects the large form of the same shape before indexing.
    try {
        TokenWarehouse wh4(unmatched_opens(2'000));
        assert(false);
    } catch (TWExc& e) {
        assert(e.getObject() == "nesting depth");
    }

    // With the limit lifted, every close looks at one candidate, so this finishes quickly.
    config.setMaxNesting(200'000);
    TokenWarehouse large(unmatched_opens(100'000), config);
    assert(large.getTokens().size() == 300'002);
    assert(!large.pairOf(200'002));
    assert(large.parentOf(200'002) == 200'000u);
}

int
main()
{
    test_pairs_and_parents();
    test_lines();
    test_by_type_and_fences();
    test_container_boundary();
    test_unmatched_opens();
    std::cout << "indices tests done" << std::endl;
    return 0;
}
