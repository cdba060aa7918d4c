#include <tokwh/assert_test.h>

#include "TestNode.hh"

#include <tokwh/Cl_Codeblocks.hh>
#include <tokwh/Cl_Footnotes.hh>
#include <tokwh/Cl_Headings.hh>
#include <tokwh/Cl_Html.hh>
#include <tokwh/Cl_Images.hh>
#include <tokwh/Cl_Links.hh>
#include <tokwh/Cl_Lists.hh>
#include <tokwh/Cl_Math.hh>
#include <tokwh/Cl_Paragraphs.hh>
#include <tokwh/Cl_Sections.hh>
#include <tokwh/Cl_Tables.hh>
#include <tokwh/Cl_Tasklists.hh>
#include <tokwh/ReferenceCollectors.hh>
#include <tokwh/TokenWarehouse.hh>

#include <iostream>

namespace
{
    typedef std::shared_ptr<TestNode> node_ptr;
    typedef std::pair<long long, long long> range;

    node_ptr
    node(
        std::string type,
        int nesting = 0,
        std::optional<range> map = std::nullopt,
        std::string tag = "",
        std::string content = "")
    {
        return TestNode::make(std::move(type), nesting, map, std::move(tag), std::move(content));
    }

    node_ptr
    inline_node(
        range map, std::string content, std::vector<std::shared_ptr<TWRawNode>> children = {})
    {
        auto n = node("inline", 0, map, "", std::move(content));
        n->children_ = std::move(children);
        return n;
    }

    std::vector<std::shared_ptr<TWRawNode>>
    heading(std::string const& tag, long long line, std::string const& title)
    {
        return {
            node("heading_open", 1, range(line, line + 1), tag),
            inline_node(range(line, line + 1), title, {node("text", 0, std::nullopt, "", title)}),
            node("heading_close", -1, std::nullopt, tag)};
    }

    std::vector<std::shared_ptr<TWRawNode>>
    list_item(long long line, std::string const& text)
    {
        return {
            node("list_item_open", 1, range(line, line + 1), "li"),
            node("paragraph_open", 1, range(line, line + 1), "p"),
            inline_node(range(line, line + 1), text),
            node("paragraph_close", -1, std::nullopt, "p"),
            node("list_item_close", -1, std::nullopt, "li")};
    }

    // A small document with one of everything.
    std::vector<std::shared_ptr<TWRawNode>>
    document()
    {
        std::vector<std::shared_ptr<TWRawNode>> doc;
        auto add = [&doc](std::vector<std::shared_ptr<TWRawNode>> const& nodes) {
            doc.insert(doc.end(), nodes.begin(), nodes.end());
        };

        add(heading("h1", 0, "Intro"));

        auto link = node("link_open", 1, std::nullopt, "a");
        link->attrs["href"] = "https://Example.com/x";
        auto image = node("image", 0, std::nullopt, "img", "alt text");
        image->attrs["src"] = "javascript:alert(1)";
        image->attrs["title"] = "T";
        add({node("paragraph_open", 1, range(2, 3), "p"),
             inline_node(
                 range(2, 3),
                 "See [docs`api`](https://Example.com/x) and ![alt text](javascript:alert(1))",
                 {node("text", 0, std::nullopt, "", "See "),
                  link,
                  node("text", 0, std::nullopt, "", "docs"),
                  node("code_inline", 0, std::nullopt, "code", "api"),
                  node("link_close", -1, std::nullopt, "a"),
                  node("text", 0, std::nullopt, "", " and "),
                  image,
                  node("math_inline", 0, std::nullopt, "math", "x^2"),
                  node("html_inline", 0, std::nullopt, "", "<b>"),
                  node("footnote_ref", 0, std::nullopt, "", "1")}),
             node("paragraph_close", -1, std::nullopt, "p")});

        add(heading("h2", 4, "Tasks"));
        add({node("bullet_list_open", 1, range(5, 8), "ul")});
        add(list_item(5, "[ ] todo"));
        add(list_item(6, "[X] done"));
        add(list_item(7, "[x]no space"));
        add({node("bullet_list_close", -1, std::nullopt, "ul")});

        auto fence = node("fence", 0, range(9, 12), "code", "print(1)\n");
        fence->info_ = "python title=x";
        add({fence, node("code_block", 0, range(12, 14), "code", "indented\n")});

        add({node("table_open", 1, range(14, 17), "table"),
             node("thead_open", 1, range(14, 15), "thead"),
             node("tr_open", 1, range(14, 15), "tr"),
             node("th_open", 1, range(14, 15), "th"),
             inline_node(range(14, 15), " A "),
             node("th_close", -1, std::nullopt, "th"),
             node("th_open", 1, range(14, 15), "th"),
             inline_node(range(14, 15), "B"),
             node("th_close", -1, std::nullopt, "th"),
             node("tr_close", -1, std::nullopt, "tr"),
             node("thead_close", -1, std::nullopt, "thead"),
             node("tbody_open", 1, range(16, 17), "tbody"),
             node("tr_open", 1, range(16, 17), "tr"),
             node("td_open", 1, range(16, 17), "td"),
             inline_node(range(16, 17), "1"),
             node("td_close", -1, std::nullopt, "td"),
             node("tr_close", -1, std::nullopt, "tr"),
             node("tbody_close", -1, std::nullopt, "tbody"),
             node("table_close", -1, std::nullopt, "table")});

        add({node("html_block", 0, range(18, 19), "", "<div>x</div>"),
             node("math_block", 0, range(19, 21), "math", "E=mc^2")});

        add({node("ordered_list_open", 1, range(21, 23), "ol")});
        add(list_item(21, "first"));
        add(list_item(22, "second"));
        add({node("ordered_list_close", -1, std::nullopt, "ol")});

        add({node("footnote_reference_open", 1, range(22, 23)),
             node("paragraph_open", 1, range(22, 23), "p"),
             inline_node(range(22, 23), "Note text"),
             node("paragraph_close", -1, std::nullopt, "p"),
             node("footnote_reference_close", -1)});
        return doc;
    }

    std::map<std::string, JSON>
    collect(std::vector<std::shared_ptr<TWCollector>> const& collectors, TWConfig const& config)
    {
        TokenWarehouse wh(document(), config);
        for (auto const& c: collectors) {
            wh.registerCollector(c);
        }
        wh.dispatchAll();
        assert(wh.getErrors().empty());
        assert(!wh.anyWarnings());
        return wh.finalizeAll();
    }

    std::vector<JSON>
    items(JSON const& result)
    {
        std::vector<JSON> v;
        result.getDictItem("items").forEachArrayItem([&v](JSON j) { v.push_back(j); });
        long long count = -1;
        assert(result.getDictItem("count").getInt(count));
        return v;
    }

    std::string
    str(JSON const& j, std::string const& key)
    {
        std::string s;
        if (!j.getDictItem(key).getString(s)) {
            std::cout << "no string " << key << " in " << j.unparse() << "\n";
            assert(false);
        }
        return s;
    }

    long long
    num(JSON const& j, std::string const& key)
    {
        long long n = 0;
        if (!j.getDictItem(key).getInt(n)) {
            std::cout << "no integer " << key << " in " << j.unparse() << "\n";
            assert(false);
        }
        return n;
    }

    bool
    flag(JSON const& j, std::string const& key)
    {
        bool b = false;
        assert(j.getDictItem(key).getBool(b));
        return b;
    }
} // namespace

static void
test_reference_set()
{
    TWConfig config;
    auto collectors = tokwh::makeReferenceCollectors(config);
    std::vector<std::string> names;
    for (auto const& c: collectors) {
        names.push_back(c->getName());
    }
    assert(
        names ==
        std::vector<std::string>(
            {"codeblocks",
             "footnotes",
             "headings",
             "html",
             "images",
             "links",
             "lists",
             "math",
             "paragraphs",
             "sections",
             "tables",
             "tasklists"}));
    for (auto const& name: names) {
        auto c = tokwh::makeReferenceCollector(name, config);
        assert(c && c->getName() == name);
    }
    assert(!tokwh::makeReferenceCollector("nope", config));

    // Every reference collector can run on the same warehouse.
    auto results = collect(collectors, config);
    assert(results.size() == names.size());
    for (auto const& [name, result]: results) {
        assert(result.isDictionary());
        assert(result.getDictItem("items").isArray());
        assert(result.getDictItem("errors").size() == 0);
    }
}

static void
test_links_and_images()
{
    TWConfig config;
    auto results =
        collect({std::make_shared<Cl_Links>(config), std::make_shared<Cl_Images>(config)}, config);
    auto links = items(results["links"]);
    assert(links.size() == 1);
    auto const& l = links.at(0);
    assert(str(l, "id") == "link_0");
    assert(str(l, "url") == "https://Example.com/x");
    assert(str(l, "normalized") == "https://example.com/x");
    assert(str(l, "scheme") == "https");
    assert(flag(l, "allowed"));
    assert(str(l, "text") == "docsapi");
    assert(num(l, "line") == 2);
    assert(num(l, "section") == 0);

    auto images = items(results["images"]);
    assert(images.size() == 1);
    auto const& i = images.at(0);
    assert(str(i, "src") == "javascript:alert(1)");
    assert(str(i, "normalized") == "javascript:alert(1)");
    assert(!flag(i, "allowed"));
    assert(str(i, "alt") == "alt text");
    assert(str(i, "title") == "T");
    assert(num(i, "line") == 2);
}

static void
test_headings_and_sections()
{
    TWConfig config;
    auto results =
        collect({std::make_shared<Cl_Headings>(), std::make_shared<Cl_Sections>()}, config);
    auto headings = items(results["headings"]);
    assert(headings.size() == 2);
    assert(num(headings.at(0), "level") == 1);
    assert(str(headings.at(0), "text") == "Intro");
    assert(num(headings.at(0), "line") == 0);
    assert(num(headings.at(0), "section") == 0);
    assert(num(headings.at(1), "level") == 2);
    assert(str(headings.at(1), "text") == "Tasks");
    assert(num(headings.at(1), "line") == 4);
    assert(num(headings.at(1), "section") == 1);

    auto sections = items(results["sections"]);
    assert(num(results["sections"], "count") == 2);
    assert(sections.size() == 2);
    assert(num(sections.at(0), "id") == 0);
    assert(num(sections.at(0), "heading") == 0);
    assert(num(sections.at(0), "start_line") == 0);
    assert(num(sections.at(0), "end_line") == 3);
    assert(str(sections.at(0), "title") == "Intro");
    assert(num(sections.at(1), "start_line") == 4);
    // The last map ends at line 23.
    assert(num(sections.at(1), "end_line") == 22);
    assert(num(sections.at(1), "level") == 2);
}

static void
test_lists_and_tasks()
{
    TWConfig config;
    auto results =
        collect({std::make_shared<Cl_Lists>(), std::make_shared<Cl_Tasklists>()}, config);
    auto lists = items(results["lists"]);
    assert(lists.size() == 2);
    assert(num(results["lists"], "count") == 5);
    assert(!flag(lists.at(0), "ordered"));
    assert(num(lists.at(0), "depth") == 0);
    assert(num(lists.at(0), "start_line") == 5);
    assert(num(lists.at(0), "section") == 1);
    assert(
        lists.at(0).getDictItem("items").unparse() ==
        JSON::parse(R"(["[ ] todo", "[X] done", "[x]no space"])").unparse());
    assert(flag(lists.at(1), "ordered"));
    assert(lists.at(1).getDictItem("items").size() == 2);

    auto tasks = items(results["tasklists"]);
    assert(tasks.size() == 2);
    assert(!flag(tasks.at(0), "checked"));
    assert(str(tasks.at(0), "text") == "todo");
    assert(num(tasks.at(0), "line") == 5);
    assert(flag(tasks.at(1), "checked"));
    assert(str(tasks.at(1), "text") == "done");
    assert(num(tasks.at(1), "line") == 6);
}

static void
test_code_tables_math()
{
    TWConfig config;
    auto results = collect(
        {std::make_shared<Cl_Codeblocks>(),
         std::make_shared<Cl_Tables>(),
         std::make_shared<Cl_Math>()},
        config);
    auto blocks = items(results["codeblocks"]);
    assert(blocks.size() == 2);
    assert(str(blocks.at(0), "kind") == "fence");
    assert(str(blocks.at(0), "info") == "python title=x");
    assert(str(blocks.at(0), "lang") == "python");
    assert(str(blocks.at(0), "content") == "print(1)\n");
    assert(num(blocks.at(0), "start_line") == 9);
    assert(num(blocks.at(0), "end_line") == 12);
    assert(str(blocks.at(1), "kind") == "indented");
    assert(str(blocks.at(1), "lang").empty());

    auto tables = items(results["tables"]);
    assert(tables.size() == 1);
    assert(
        tables.at(0).getDictItem("rows").unparse() ==
        JSON::parse(R"([["A", "B"], ["1"]])").unparse());
    assert(flag(tables.at(0), "header"));
    assert(num(tables.at(0), "columns") == 2);
    assert(num(tables.at(0), "start_line") == 14);

    auto math = items(results["math"]);
    assert(math.size() == 2);
    assert(!flag(math.at(0), "display"));
    assert(str(math.at(0), "content") == "x^2");
    assert(num(math.at(0), "line") == 2);
    assert(flag(math.at(1), "display"));
    assert(num(math.at(1), "line") == 19);
}

static void
test_html()
{
    TWConfig config;
    auto results = collect({std::make_shared<Cl_Html>(config)}, config);
    assert(items(results["html"]).empty());
    assert(!flag(results["html"], "allowed"));
    assert(num(results["html"], "dropped") == 2);

    config.setAllowRawHtml(true);
    results = collect({std::make_shared<Cl_Html>(config)}, config);
    auto html = items(results["html"]);
    assert(html.size() == 2);
    assert(str(html.at(0), "kind") == "inline");
    assert(str(html.at(0), "content") == "<b>");
    assert(flag(html.at(0), "needs_sanitization"));
    assert(str(html.at(1), "kind") == "block");
    assert(num(html.at(1), "line") == 18);
    assert(num(results["html"], "dropped") == 0);
}

static void
test_footnotes_and_paragraphs()
{
    TWConfig config;
    auto results =
        collect({std::make_shared<Cl_Footnotes>(), std::make_shared<Cl_Paragraphs>()}, config);
    auto notes = items(results["footnotes"]);
    assert(notes.size() == 2);
    assert(str(notes.at(0), "kind") == "reference");
    assert(str(notes.at(0), "text") == "1");
    assert(num(notes.at(0), "line") == 2);
    assert(num(notes.at(0), "section") == 0);
    assert(str(notes.at(1), "kind") == "definition");
    assert(str(notes.at(1), "text") == "Note text");
    assert(flag(notes.at(1), "closed"));
    assert(num(notes.at(1), "line") == 22);
    assert(num(notes.at(1), "section") == 1);

    auto paragraphs = items(results["paragraphs"]);
    assert(num(results["paragraphs"], "count") == 7);
    std::vector<std::string> texts;
    for (auto const& p: paragraphs) {
        texts.push_back(str(p, "text"));
    }
    assert(texts.front().starts_with("See [docs`api`]"));
    assert(
        std::vector<std::string>(texts.begin() + 1, texts.end()) ==
        std::vector<std::string>(
            {"[ ] todo", "[X] done", "[x]no space", "first", "second", "Note text"}));
    assert(num(paragraphs.at(0), "line") == 2);
    assert(num(paragraphs.at(0), "section") == 0);
    assert(num(paragraphs.at(6), "line") == 22);
    assert(num(paragraphs.at(6), "section") == 1);

    // A definition that is never closed keeps the text seen so far.
    TokenWarehouse wh(std::vector<std::shared_ptr<TWRawNode>>{
        node("footnote_reference_open", 1, range(0, 1)),
        node("paragraph_open", 1, range(0, 1), "p"),
        inline_node(range(0, 1), "dangling")});
    auto footnotes = std::make_shared<Cl_Footnotes>();
    wh.registerCollector(footnotes);
    wh.dispatchAll();
    auto dangling = items(wh.finalizeAll()["footnotes"]);
    assert(dangling.size() == 1);
    assert(str(dangling.at(0), "text") == "dangling");
    assert(!flag(dangling.at(0), "closed"));
}

int
main()
{
    test_reference_set();
    test_links_and_images();
    test_headings_and_sections();
    test_lists_and_tasks();
    test_code_tables_math();
    test_html();
    test_footnotes_and_paragraphs();
    std::cout << "collectors tests done" << std::endl;
    return 0;
}
