#include <tokwh/assert_test.h>

#include "TestNode.hh"

#include <tokwh/Cl_Links.hh>
#include <tokwh/Cl_Tables.hh>
#include <tokwh/Pl_String.hh>
#include <tokwh/ReferenceCollectors.hh>
#include <tokwh/TWExc.hh>
#include <tokwh/TokenWarehouse.hh>

#include <algorithm>
#include <chrono>
#include <functional>
#include <iostream>

namespace
{
    // Records the index of every token it sees. Hooks let individual tests make it misbehave.
    class Recorder: public TWCollector
    {
      public:
        Recorder(
            std::string name,
            std::set<std::string> types,
            std::set<std::string> ignore_inside = {}) :
            name(std::move(name)),
            interest{std::move(types), std::move(ignore_inside)}
        {
        }
        ~Recorder() override = default;

        std::string
        getName() const override
        {
            return name;
        }
        TWInterest
        getInterest() const override
        {
            return interest;
        }
        bool
        shouldProcess(TWTokenView const& view, TWDispatchContext&, TokenWarehouse&) override
        {
            return !skip_type || view.type() != *skip_type;
        }
        void
        onToken(size_t index, TWTokenView const& view, TWDispatchContext& ctx, TokenWarehouse& wh)
            override
        {
            assert(ctx.getTokenIndex() == index);
            assert(ctx.getCollectorName() == name);
            assert(&wh.getTokens().at(index) == &view);
            seen.push_back(index);
            if (on_token) {
                on_token(index, wh);
            }
        }
        JSON
        finalize(TokenWarehouse&) override
        {
            if (on_finalize) {
                return on_finalize();
            }
            auto result = JSON::makeDictionary();
            auto items = result.addDictionaryMember("items", JSON::makeArray());
            for (auto i: seen) {
                items.addArrayElement(JSON::makeInt(static_cast<long long>(i)));
            }
            return result;
        }
        size_t
        itemCount() const override
        {
            return seen.size();
        }

        std::string name;
        TWInterest interest;
        std::optional<std::string> skip_type;
        std::vector<size_t> seen;
        std::function<void(size_t, TokenWarehouse&)> on_token;
        std::function<JSON()> on_finalize;
    };

    std::shared_ptr<TWLogger>
    capture_logger(std::string& out)
    {
        auto l = TWLogger::create();
        l->setWarn(std::make_shared<Pl_String>("warnings", nullptr, out));
        return l;
    }

    std::shared_ptr<TWLogger>
    quiet_logger()
    {
        auto l = TWLogger::create();
        l->setWarn(l->discard());
        return l;
    }

    TWTokenView
    tok(std::string type, int nesting = 0, std::optional<std::string> href = std::nullopt)
    {
        return {std::move(type), nesting, "", std::nullopt, std::nullopt, "", std::move(href)};
    }

    // A mixed document of n tokens with headings, paragraphs, links and fences.
    std::vector<TWTokenView>
    mixed_document(size_t n)
    {
        std::vector<TWTokenView> tokens;
        long long line = 0;
        while (tokens.size() < n) {
            TWTokenView::LineRange map{line, line + 1};
            auto k = line % 4;
            if (k == 0) {
                tokens.emplace_back("heading_open", 1, "h2", map, std::nullopt, "", std::nullopt);
                tokens.emplace_back(
                    "inline", 0, "", map, std::nullopt, "Heading " + std::to_string(line),
                    std::nullopt);
                tokens.emplace_back("heading_close", -1, "h2", std::nullopt, std::nullopt, "",
                                    std::nullopt);
            } else if (k == 1) {
                tokens.emplace_back(
                    "fence", 0, "code", map, "js", "x = " + std::to_string(line), std::nullopt);
            } else {
                tokens.emplace_back(
                    "link_open", 1, "a", map, std::nullopt, "",
                    "https://example.com/" + std::to_string(line));
                tokens.push_back(tok("text"));
                tokens.push_back(tok("link_close", -1));
            }
            ++line;
        }
        tokens.resize(n);
        return tokens;
    }

    std::vector<long long>
    items_of(JSON const& result)
    {
        std::vector<long long> items;
        result.getDictItem("items").forEachArrayItem([&items](JSON j) {
            long long v = 0;
            assert(j.getInt(v));
            items.push_back(v);
        });
        return items;
    }
} // namespace

static void
test_basic_routing()
{
    std::vector<TWTokenView> tokens{tok("a"), tok("b"), tok("a"), tok("c")};
    TokenWarehouse wh(tokens);
    auto r1 = std::make_shared<Recorder>("r1", std::set<std::string>{"a"});
    auto r2 = std::make_shared<Recorder>("r2", std::set<std::string>{"a", "c"});
    r2->skip_type = "c";
    wh.registerCollector(r1);
    wh.registerCollector(r2);
    assert(wh.getState() == TokenWarehouse::st_idle);
    wh.dispatchAll();
    assert(wh.getState() == TokenWarehouse::st_finalized);
    assert(r1->seen == std::vector<size_t>({0, 2}));
    assert(r2->seen == std::vector<size_t>({0, 2}));

    auto results = wh.finalizeAll();
    assert(results.size() == 2);
    assert(items_of(results["r1"]) == std::vector<long long>({0, 2}));
    long long count = 0;
    assert(results["r1"].getDictItem("count").getInt(count) && count == 2);
    bool truncated = true;
    assert(results["r1"].getDictItem("truncated").getBool(truncated) && !truncated);
    assert(results["r1"].getDictItem("errors").isArray());
    assert(results["r1"].getDictItem("errors").size() == 0);
    assert(!wh.anyWarnings());

    // The warehouse lets go of its collectors.
    assert(r1.use_count() == 1);
}

static void
test_lifecycle_errors()
{
    TokenWarehouse wh(std::vector<TWTokenView>{tok("a")});
    auto expect_logic = [](std::function<void()> fn) {
        try {
            fn();
            assert(false);
        } catch (TWReentrancyError&) {
            assert(false);
        } catch (std::logic_error& e) {
            std::cout << "expected: " << e.what() << "\n";
        }
    };
    expect_logic([&]() { wh.registerCollector(nullptr); });
    wh.registerCollector(std::make_shared<Recorder>("x", std::set<std::string>{"a"}));
    expect_logic(
        [&]() { wh.registerCollector(std::make_shared<Recorder>("x", std::set<std::string>{})); });
    expect_logic([&]() { wh.finalizeAll(); });
    wh.dispatchAll();
    expect_logic(
        [&]() { wh.registerCollector(std::make_shared<Recorder>("y", std::set<std::string>{})); });
    try {
        wh.dispatchAll();
        assert(false);
    } catch (TWReentrancyError&) {
    }
    wh.finalizeAll();
    expect_logic([&]() { wh.finalizeAll(); });
}

static void
test_failing_accessor()
{
    // An attribute accessor that throws never reaches dispatch.
    auto link = TestNode::make("link_open", 1, std::make_pair(0LL, 1LL), "a");
    link->throwing = {"attr:href"};
    std::string warnings;
    TWConfig config;
    TokenWarehouse wh(
        std::vector<std::shared_ptr<TWRawNode>>{
            link,
            TestNode::make("text", 0, std::nullopt, "", "click"),
            TestNode::make("link_close", -1, std::nullopt, "a")},
        config,
        "",
        capture_logger(warnings));
    assert(!wh.getTokens().at(0).href());
    assert(wh.numWarnings() == 1);
    assert(wh.getWarnings().at(0).getErrorCode() == tokwh_e_malformed_node);
    assert(warnings.find("WARNING: ") == 0);
    assert(warnings.find("attr:href exploded") != std::string::npos);

    wh.registerCollector(std::make_shared<Cl_Links>(config));
    wh.dispatchAll();
    assert(wh.getErrors().empty());
    auto results = wh.finalizeAll();
    auto const& links = results["links"];
    assert(links.getDictItem("errors").size() == 0);
    assert(links.getDictItem("items").size() == 1);
    links.getDictItem("items").forEachArrayItem([](JSON item) {
        bool allowed = true;
        assert(item.getDictItem("allowed").getBool(allowed) && !allowed);
        std::string text;
        assert(item.getDictItem("text").getString(text) && text == "click");
    });
}

static void
test_item_cap()
{
    size_t constexpr n = 10'005;
    std::vector<TWTokenView> tokens;
    for (size_t i = 0; i < n; ++i) {
        tokens.push_back(tok("link_open", 1, "https://example.com/" + std::to_string(i)));
        tokens.push_back(tok("link_close", -1));
    }
    TWConfig config;
    config.applySetting("TOKWH_MAX_ITEMS_PER_TYPE", "links=10000");
    config.setMaxItems("other", 100'000);
    std::string warnings;
    TokenWarehouse wh(tokens, config, "", capture_logger(warnings));
    wh.registerCollector(std::make_shared<Cl_Links>(config));
    auto other = std::make_shared<Recorder>("other", std::set<std::string>{"link_open"});
    wh.registerCollector(other);
    wh.dispatchAll();
    assert(other->seen.size() == n);

    auto results = wh.finalizeAll();
    auto const& links = results["links"];
    assert(links.getDictItem("items").size() == 10'000);
    long long count = 0;
    assert(links.getDictItem("count").getInt(count) && count == 10'000);
    bool truncated = false;
    assert(links.getDictItem("truncated").getBool(truncated) && truncated);
    assert(results["other"].getDictItem("truncated").getBool(truncated) && !truncated);
    // One notice per truncated collector
    assert(wh.numWarnings() == 1);
    assert(warnings.find("item cap of 10000") != std::string::npos);

    // A cap of zero truncates before the first token.
    TWConfig zero;
    zero.setMaxItems("zero", 0);
    TokenWarehouse wh2(std::vector<TWTokenView>{tok("a")}, zero, "", quiet_logger());
    auto z = std::make_shared<Recorder>("zero", std::set<std::string>{"a"});
    wh2.registerCollector(z);
    wh2.dispatchAll();
    assert(z->seen.empty());
    assert(wh2.finalizeAll()["zero"].getDictItem("truncated").getBool(truncated) && truncated);
}

static void
test_cap_keeps_last_item()
{
    auto with_content = [](std::string type, int nesting, std::string content) {
        return TWTokenView(
            std::move(type), nesting, "", std::nullopt, std::nullopt, std::move(content),
            std::nullopt);
    };
    std::vector<TWTokenView> tokens;
    for (auto const& word: {"first", "second", "third"}) {
        tokens.push_back(tok("link_open", 1, std::string("https://example.com/") + word));
        tokens.push_back(with_content("text", 0, word));
        tokens.push_back(tok("link_close", -1));
    }
    for (auto const& cell: {"cell", "other"}) {
        tokens.push_back(tok("table_open", 1));
        tokens.push_back(tok("tr_open", 1));
        tokens.push_back(tok("td_open", 1));
        tokens.push_back(with_content("inline", 0, cell));
        tokens.push_back(tok("td_close", -1));
        tokens.push_back(tok("tr_close", -1));
        tokens.push_back(tok("table_close", -1));
    }

    TWConfig config;
    config.applySetting("TOKWH_MAX_ITEMS_PER_TYPE", "links=2,tables=1,plain=1");
    std::string warnings;
    TokenWarehouse wh(tokens, config, "", capture_logger(warnings));
    wh.registerCollector(std::make_shared<Cl_Links>(config));
    wh.registerCollector(std::make_shared<Cl_Tables>());
    // Never asks for admission, so it is cut off as soon as it reaches its cap.
    auto plain = std::make_shared<Recorder>("plain", std::set<std::string>{"text"});
    wh.registerCollector(plain);
    wh.dispatchAll();
    assert(plain->seen == std::vector<size_t>({1}));

    auto results = wh.finalizeAll();
    bool truncated = false;
    long long count = 0;

    auto const& links = results["links"];
    assert(links.getDictItem("truncated").getBool(truncated) && truncated);
    assert(links.getDictItem("count").getInt(count) && count == 2);
    std::vector<std::string> texts;
    links.getDictItem("items").forEachArrayItem([&texts](JSON j) {
        std::string text;
        assert(j.getDictItem("text").getString(text));
        texts.push_back(text);
    });
    assert(texts == std::vector<std::string>({"first", "second"}));

    auto const& tables = results["tables"];
    assert(tables.getDictItem("truncated").getBool(truncated) && truncated);
    assert(tables.getDictItem("items").size() == 1);
    tables.getDictItem("items").forEachArrayItem([](JSON j) {
        auto rows = j.getDictItem("rows");
        assert(rows.size() == 1);
        rows.forEachArrayItem([](JSON row) {
            assert(row.size() == 1);
            row.forEachArrayItem([](JSON c) {
                std::string cell;
                assert(c.getString(cell) && cell == "cell");
            });
        });
        long long columns = 0;
        assert(j.getDictItem("columns").getInt(columns) && columns == 1);
    });

    assert(results["plain"].getDictItem("truncated").getBool(truncated) && truncated);
    // One notice per capped collector
    assert(wh.numWarnings() == 3);

    // Exactly as many items as the cap: every item is complete and the result is flagged.
    tokens.resize(6);
    TWConfig exact;
    exact.setMaxItems("links", 2);
    TokenWarehouse wh2(tokens, exact, "", quiet_logger());
    wh2.registerCollector(std::make_shared<Cl_Links>(exact));
    wh2.dispatchAll();
    auto exact_links = wh2.finalizeAll()["links"];
    assert(exact_links.getDictItem("truncated").getBool(truncated) && truncated);
    assert(exact_links.getDictItem("items").unparse().find("\"second\"") != std::string::npos);
}

static void
test_determinism()
{
    auto tokens = mixed_document(5'000);
    assert(tokens.size() == 5'000);
    TWConfig config;

    auto run = [&](bool reverse) {
        TokenWarehouse wh(tokens, config, "", quiet_logger());
        auto collectors = tokwh::makeReferenceCollectors(config);
        if (reverse) {
            std::reverse(collectors.begin(), collectors.end());
        }
        for (auto const& c: collectors) {
            wh.registerCollector(c);
        }
        wh.dispatchAll();
        return wh.finalizeAll();
    };
    auto forward = run(false);
    auto backward = run(true);
    auto j1 = TokenWarehouse::resultsToJSON(forward).unparse();
    auto j2 = TokenWarehouse::resultsToJSON(backward).unparse();
    assert(j1 == j2);
    assert(TokenWarehouse::fingerprint(forward) == TokenWarehouse::fingerprint(backward));
    assert(TokenWarehouse::fingerprint(forward).size() == 64);
    assert(forward["links"].getDictItem("items").size() > 0);
    assert(forward["headings"].getDictItem("items").size() > 0);

    // Two collectors of the same kind registered in both orders
    auto pair_run = [&](bool reverse) {
        TokenWarehouse wh(tokens, config, "", quiet_logger());
        auto a = std::make_shared<Recorder>("A", std::set<std::string>{"text", "fence"});
        auto b = std::make_shared<Recorder>(
            "B", std::set<std::string>{"inline"}, std::set<std::string>{"link"});
        wh.registerCollector(reverse ? b : a);
        wh.registerCollector(reverse ? a : b);
        wh.dispatchAll();
        return TokenWarehouse::fingerprint(wh.finalizeAll());
    };
    assert(pair_run(false) == pair_run(true));
}

static void
test_reentrancy()
{
    std::vector<TWTokenView> tokens{tok("a"), tok("a"), tok("a")};
    {
        TokenWarehouse wh(tokens);
        size_t caught = 0;
        auto r = std::make_shared<Recorder>("r", std::set<std::string>{"a"});
        r->on_token = [&caught](size_t, TokenWarehouse& w) {
            assert(w.getState() == TokenWarehouse::st_dispatching);
            try {
                w.dispatchAll();
            } catch (TWReentrancyError&) {
                ++caught;
            }
        };
        wh.registerCollector(r);
        wh.dispatchAll();
        assert(caught == 3);
        // No token was processed twice.
        assert(r->seen == std::vector<size_t>({0, 1, 2}));
        assert(wh.getErrors().empty());
        wh.finalizeAll();
    }
    {
        // Not caught: the error leaves dispatchAll and is not recorded as a collector failure.
        TokenWarehouse wh(tokens);
        auto r = std::make_shared<Recorder>("r", std::set<std::string>{"a"});
        r->on_token = [](size_t, TokenWarehouse& w) { w.dispatchAll(); };
        wh.registerCollector(r);
        try {
            wh.dispatchAll();
            assert(false);
        } catch (TWReentrancyError& e) {
            std::cout << "expected: " << e.what() << "\n";
        }
        assert(wh.getState() == TokenWarehouse::st_finalized);
        assert(r->seen.size() == 1);
        assert(wh.getErrors().empty());
        auto results = wh.finalizeAll();
        assert(results.count("r") == 1);
    }
}

static void
test_collector_errors()
{
    std::vector<TWTokenView> tokens{tok("a"), tok("a"), tok("a"), tok("a")};
    std::string warnings;
    TWConfig config;
    config.setMaxWarnings(2);
    TokenWarehouse wh(tokens, config, "", capture_logger(warnings));
    auto bad = std::make_shared<Recorder>("bad", std::set<std::string>{"a"});
    bad->on_token = [](size_t i, TokenWarehouse&) {
        if (i % 2 == 0) {
            throw std::runtime_error("boom " + std::to_string(i));
        }
    };
    bad->on_finalize = []() -> JSON { throw std::logic_error("finalize failed"); };
    auto good = std::make_shared<Recorder>("good", std::set<std::string>{"a"});
    good->on_finalize = []() { return JSON::makeString("not a dictionary"); };
    wh.registerCollector(good);
    wh.registerCollector(bad);
    wh.dispatchAll();

    // Failures of one collector do not affect the other.
    assert(good->seen.size() == 4);
    assert(bad->seen.size() == 4);
    auto const& errors = wh.getErrors();
    assert(errors.size() == 2);
    assert(errors.at(0).collector == "bad");
    assert(errors.at(0).token_index == 0u);
    assert(errors.at(0).kind == "exception");
    assert(errors.at(0).exception_type == "std::runtime_error");
    assert(errors.at(0).message == "boom 0");
    assert(errors.at(1).token_index == 2u);

    auto results = wh.finalizeAll();
    assert(wh.getErrors().size() == 3);
    auto const& b = results["bad"];
    assert(b.getDictItem("items").isArray() && b.getDictItem("items").size() == 0);
    long long count = -1;
    assert(b.getDictItem("count").getInt(count) && count == 0);
    assert(b.getDictItem("errors").size() == 3);
    auto last = JSON::makeNull();
    b.getDictItem("errors").forEachArrayItem([&last](JSON e) { last = e; });
    assert(last.getDictItem("token").isNull());
    assert(last.hasDictItem("token"));
    std::string s;
    assert(last.getDictItem("type").getString(s) && s == "std::logic_error");
    assert(last.getDictItem("message").getString(s) && s == "finalize failed");
    assert(last.getDictItem("kind").getString(s) && s == "exception");
    assert(last.getDictItem("collector").getString(s) && s == "bad");

    // A non-dictionary result is wrapped.
    auto const& g = results["good"];
    assert(g.getDictItem("items").getString(s) && s == "not a dictionary");
    assert(g.getDictItem("count").getInt(count) && count == 4);
    assert(g.getDictItem("errors").size() == 0);

    // Three warnings; two are kept and the overflow is announced once.
    assert(wh.numWarnings() == 3);
    assert(wh.getWarnings().size() == 2);
    assert(wh.getWarnings().at(0).getErrorCode() == tokwh_e_collector);
    assert(warnings.find("too many warnings") != std::string::npos);
    assert(warnings.find("finalize failed") == std::string::npos);
}

static void
test_strict()
{
    std::vector<TWTokenView> tokens{tok("a"), tok("a")};
    TWConfig config;
    config.setStrict(true);
    TokenWarehouse wh(tokens, config);
    auto bad = std::make_shared<Recorder>("bad", std::set<std::string>{"a"});
    bad->on_token = [](size_t, TokenWarehouse&) { throw std::runtime_error("strict boom"); };
    wh.registerCollector(bad);
    try {
        wh.dispatchAll();
        assert(false);
    } catch (TWExc& e) {
        assert(e.getErrorCode() == tokwh_e_collector);
        assert(e.getObject() == "bad");
        assert(e.getPosition() == 0);
        std::cout << "expected: " << e.what() << "\n";
    }
    assert(wh.getState() == TokenWarehouse::st_finalized);
    assert(bad->seen.size() == 1);
    assert(wh.getErrors().size() == 1);
}

// Returns the indices seen by a text collector that ignores blockquotes and nested nodes. With
// many_types, another collector ignores enough types to rule out the bit mask.
static std::vector<size_t>
ignore_run(bool many_types)
{
    auto inl = TestNode::make("custom");
    inl->children_ = {
        TestNode::make("text"), TestNode::make("softbreak"), TestNode::make("text")};
    auto inner = TestNode::make("container");
    inner->children_ = {TestNode::make("text")};
    std::vector<std::shared_ptr<TWRawNode>> nodes{
        TestNode::make("text"),                 // 0 seen
        TestNode::make("blockquote_open", 1),   // 1
        TestNode::make("text"),                 // 2
        TestNode::make("blockquote_open", 1),   // 3
        TestNode::make("text"),                 // 4
        TestNode::make("blockquote_close", -1), // 5
        TestNode::make("text"),                 // 6 still inside the outer quote
        TestNode::make("blockquote_close", -1), // 7
        TestNode::make("text"),                 // 8 seen
        inl,                                    // 9, children 10 .. 12
        TestNode::make("text"),                 // 13 seen
        TestNode::make("table_open", 1),        // 14
        inner,                                  // 15, child 16
        TestNode::make("table_close", -1),      // 17
        TestNode::make("text"),                 // 18 seen
    };
    TokenWarehouse wh(nodes, TWConfig(), "", quiet_logger());
    assert(wh.getTokens().size() == 19);
    auto r = std::make_shared<Recorder>(
        "r",
        std::set<std::string>{"text", "blockquote_close", "custom"},
        std::set<std::string>{"blockquote_open", "custom", "table_open"});
    wh.registerCollector(r);
    if (many_types) {
        std::set<std::string> ignore;
        for (int i = 0; i < 70; ++i) {
            ignore.insert("type" + std::to_string(i));
        }
        wh.registerCollector(std::make_shared<Recorder>("s", std::set<std::string>{}, ignore));
    }
    wh.dispatchAll();
    return r->seen;
}

static void
test_ignore_inside()
{
    auto mask = ignore_run(false);
    auto depth = ignore_run(true);
    assert(mask == std::vector<size_t>({0, 8, 13, 18}));
    assert(depth == mask);

    // The context reports the depth of enclosing ignored regions.
    std::vector<TWTokenView> tokens{
        tok("fence_open", 1), tok("text"), tok("fence_close", -1), tok("text")};
    TokenWarehouse wh(tokens);
    std::vector<size_t> depths;
    class DepthReader: public Recorder
    {
      public:
        DepthReader(std::vector<size_t>& depths) :
            Recorder("depths", {"text", "fence_open"}),
            depths(depths)
        {
        }
        void
        onToken(size_t, TWTokenView const&, TWDispatchContext& ctx, TokenWarehouse&) override
        {
            depths.push_back(ctx.ignoreDepth("fence"));
            assert(ctx.insideIgnored("fence_open") == (depths.back() > 0));
        }
        std::vector<size_t>& depths;
    };
    wh.registerCollector(std::make_shared<DepthReader>(depths));
    wh.registerCollector(
        std::make_shared<Recorder>("x", std::set<std::string>{}, std::set<std::string>{"fence"}));
    wh.dispatchAll();
    assert(depths == std::vector<size_t>({1, 1, 0}));
}

static double
median_seconds(std::function<void()> fn)
{
    std::vector<double> times;
    for (int i = 0; i < 5; ++i) {
        auto start = std::chrono::steady_clock::now();
        fn();
        times.push_back(
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count());
    }
    std::sort(times.begin(), times.end());
    return times[2];
}

static void
test_linear_scaling()
{
    // Twice the tokens may take at most about 2.5 times as long. The absolute allowance keeps
    // timer noise on tiny inputs from failing the test.
    auto check_ratio = [](char const* what, double small, double large, double allowance) {
        std::cout << "scaling " << what << ": " << small << "s -> " << large << "s\n";
        assert(large <= 2.5 * small + allowance);
    };

    auto mixed_run = [](size_t n) {
        auto tokens = mixed_document(n);
        size_t calls = 0;
        auto seconds = median_seconds([&]() {
            TokenWarehouse wh(tokens, TWConfig(), "", quiet_logger());
            auto r = std::make_shared<Recorder>(
                "r", std::set<std::string>{"text", "inline"}, std::set<std::string>{"fence"});
            wh.registerCollector(r);
            for (auto const& c: tokwh::makeReferenceCollectors(TWConfig())) {
                wh.registerCollector(c);
            }
            wh.dispatchAll();
            wh.finalizeAll();
            calls = r->seen.size();
        });
        return std::make_pair(seconds, calls);
    };
    auto [small, small_calls] = mixed_run(1'000);
    auto [large, large_calls] = mixed_run(2'000);
    // Each token reaches a collector at most once.
    assert(small_calls <= 1'000);
    assert(large_calls >= 2 * small_calls - 2 && large_calls <= 2 * small_calls + 2);
    check_ratio("mixed document", small, large, 0.005);

    // Opens that never close, followed by closes whose only partner lies outside the enclosing
    // children, must not make index construction revisit the open stack.
    auto hostile = [](size_t k) {
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
        std::vector<std::shared_ptr<TWRawNode>> nodes{TestNode::make("a_open", 1), holder};
        TWConfig config;
        config.setMaxNesting(100'000);
        config.setMaxItems("r", 100'000);
        return median_seconds([&]() {
            TokenWarehouse wh(nodes, config, "", quiet_logger());
            wh.registerCollector(
                std::make_shared<Recorder>("r", std::set<std::string>{"a_close", "c_open"}));
            wh.dispatchAll();
            wh.finalizeAll();
        });
    };
    check_ratio("unmatched opens", hostile(10'000), hostile(20'000), 0.05);
}

int
main()
{
    test_basic_routing();
    test_lifecycle_errors();
    test_failing_accessor();
    test_item_cap();
    test_cap_keeps_last_item();
    test_determinism();
    test_reentrancy();
    test_collector_errors();
    test_strict();
    test_ignore_inside();
    test_linear_scaling();
    std::cout << "dispatch tests done" << std::endl;
    return 0;
}
