#include <tokwh/assert_test.h>

#include "TestNode.hh"

#include <tokwh/TokenWarehouse.hh>

#include <iostream>

namespace
{
    std::vector<TWTokenView>
    heading(std::string const& tag, long long start, std::string const& title)
    {
        TWTokenView::LineRange map{start, start + 1};
        return {
            TWTokenView("heading_open", 1, tag, map, {}, "", {}),
            TWTokenView("inline", 0, "", map, {}, title, {}),
            TWTokenView("heading_close", -1, tag, {}, {}, "", {})};
    }

    std::vector<TWTokenView>
    concat(std::vector<std::vector<TWTokenView>> const& parts)
    {
        std::vector<TWTokenView> result;
        for (auto const& p: parts) {
            result.insert(result.end(), p.begin(), p.end());
        }
        return result;
    }

    TWTokenView
    paragraph(long long start, long long end)
    {
        return TWTokenView("paragraph_open", 1, "p", TWTokenView::LineRange{start, end}, {}, "",
                           {});
    }

    TWSection
    section(std::optional<size_t> heading, long long start, long long end, int level,
            std::string title)
    {
        TWSection s;
        s.heading_index = heading;
        s.start_line = start;
        s.end_line = end;
        s.level = level;
        s.title = std::move(title);
        return s;
    }
} // namespace

static void
test_negative_map()
{
    // A heading whose map lies before the document is clamped to line 0.
    auto h = TestNode::make("heading_open", 1, std::make_pair(-100LL, -50LL), "h2");
    TokenWarehouse wh(std::vector<std::shared_ptr<TWRawNode>>{
        h,
        TestNode::make("inline", 0, std::nullopt, "", "Intro"),
        TestNode::make("heading_close", -1, std::nullopt, "h2")});
    assert(wh.getTokens().at(0).map() == TWTokenView::LineRange({0, 0}));
    auto const& sections = wh.getSections();
    assert(sections.size() == 1);
    assert(sections.at(0) == section(0, 0, 0, 2, "Intro"));
    assert(wh.sectionOf(0) == 0u);
    assert(!wh.sectionOf(1));
}

static void
test_preamble()
{
    auto tokens = concat({{paragraph(0, 2)}, heading("h1", 3, "One"), heading("h3", 7, "Two")});
    TokenWarehouse wh(tokens, TWConfig(), std::string(12, '\n'));
    assert(wh.lineCount() == 12);
    std::vector<TWSection> expected{
        section(std::nullopt, 0, 2, 0, ""),
        section(1, 3, 6, 1, "One"),
        section(4, 7, 11, 3, "Two")};
    assert(wh.getSections() == expected);

    assert(wh.sectionOf(0) == 0u);
    assert(wh.sectionOf(2) == 0u);
    assert(wh.sectionOf(3) == 1u);
    assert(wh.sectionOf(6) == 1u);
    assert(wh.sectionOf(7) == 2u);
    assert(wh.sectionOf(11) == 2u);
    assert(!wh.sectionOf(12));
    assert(!wh.sectionOf(-1));
    assert(!wh.sectionOf(-1'000'000'000'000LL));
}

static void
test_ordering_and_duplicates()
{
    // Out of order, a duplicate start line, a heading without a map and a bad level.
    auto tokens = concat(
        {heading("h2", 10, "Late"),
         heading("h4", 2, "Early"),
         heading("h1", 2, "Duplicate"),
         {TWTokenView("heading_open", 1, "h1", {}, {}, "", {})},
         heading("h9", 5, "Odd")});
    TokenWarehouse wh(tokens);
    std::vector<TWSection> expected{
        section(std::nullopt, 0, 1, 0, ""),
        section(3, 2, 4, 4, "Early"),
        section(10, 5, 9, 1, "Odd"),
        section(0, 10, 10, 2, "Late")};
    assert(wh.getSections() == expected);
    // Line 11 is the end of the last map, which is outside the document.
    assert(wh.lineCount() == 11);
    assert(wh.sectionOf(10) == 3u);
    assert(!wh.sectionOf(11));
}

static void
test_no_headings()
{
    TokenWarehouse empty(std::vector<TWTokenView>{});
    assert(empty.getSections().size() == 1);
    assert(empty.getSections().at(0) == section(std::nullopt, 0, 0, 0, ""));
    assert(empty.sectionOf(0) == 0u);

    TokenWarehouse text(std::vector<TWTokenView>{paragraph(0, 4)}, TWConfig(), "a\nb\nc\nd\n");
    assert(text.getSections().size() == 1);
    assert(text.getSections().at(0).end_line == 3);
    assert(text.sectionOf(3) == 0u);
    assert(!text.sectionOf(4));
}

int
main()
{
    test_negative_map();
    test_preamble();
    test_ordering_and_duplicates();
    test_no_headings();
    std::cout << "sections tests done" << std::endl;
    return 0;
}
