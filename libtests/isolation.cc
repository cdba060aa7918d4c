#include <tokwh/assert_test.h>

#include <tokwh/Cl_Links.hh>
#include <tokwh/TWExc.hh>
#include <tokwh/TWIsolatedRunner.hh>
#include <tokwh/TokenWarehouse.hh>

#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <stdexcept>

namespace
{
    class Custom: public TWCollector
    {
      public:
        Custom(std::function<void()> work, bool bad_interest = false) :
            work(std::move(work)),
            bad_interest(bad_interest)
        {
        }
        ~Custom() override = default;

        std::string
        getName() const override
        {
            return "custom";
        }
        TWInterest
        getInterest() const override
        {
            if (bad_interest) {
                throw std::runtime_error("no interest available");
            }
            return {{"text"}, {}};
        }
        void
        onToken(size_t, TWTokenView const&, TWDispatchContext&, TokenWarehouse&) override
        {
            ++calls;
            work();
        }
        JSON
        finalize(TokenWarehouse&) override
        {
            return JSON::makeDictionary();
        }
        size_t
        itemCount() const override
        {
            return 0;
        }

        std::function<void()> work;
        bool bad_interest;
        size_t calls{0};
    };

    TWTokenView
    tok(std::string type, int nesting, std::string content = "")
    {
        return TWTokenView(
            std::move(type), nesting, "", std::nullopt, std::nullopt, std::move(content),
            std::nullopt);
    }

    std::vector<TWTokenView>
    document()
    {
        auto open = TWTokenView(
            "link_open", 1, "a", std::nullopt, std::nullopt, "", "https://example.com/x");
        return {open, tok("text", 0, "click"), tok("link_close", -1)};
    }

    std::shared_ptr<TWLogger>
    quiet_logger()
    {
        auto l = TWLogger::create();
        l->setWarn(l->discard());
        return l;
    }

    void
    check_failure_result(TWIsolatedResult const& r, std::string const& kind)
    {
        assert(r.result.getDictItem("items").size() == 0);
        long long count = -1;
        assert(r.result.getDictItem("count").getInt(count) && count == 0);
        auto errors = r.result.getDictItem("errors");
        assert(errors.size() == 1);
        errors.forEachArrayItem([&kind, &r](JSON error) {
            std::string value;
            assert(error.getDictItem("kind").getString(value) && value == kind);
            assert(error.getDictItem("collector").getString(value) && value == "custom");
            assert(error.getDictItem("message").getString(value) && value == r.message);
            assert(error.getDictItem("token").isNull());
        });
    }
} // namespace

#ifndef _WIN32

static void
test_same_result_as_in_process()
{
    TWConfig config;
    TokenWarehouse wh(document(), config, "", quiet_logger());
    wh.registerCollector(std::make_shared<Cl_Links>(config));
    wh.dispatchAll();
    auto expected = wh.finalizeAll()["links"].unparse();

    auto r = TWIsolatedRunner::run(document(), std::make_shared<Cl_Links>(config), 5'000, config);
    assert(r.status == TWIsolatedResult::st_ok);
    assert(r.exit_code == TWIsolatedRunner::exit_ok);
    assert(r.message.empty());
    assert(r.result.unparse() == expected);
    std::string text;
    r.result.getDictItem("items").forEachArrayItem([&text](JSON item) {
        assert(item.getDictItem("text").getString(text));
    });
    assert(text == "click");
}

static void
test_never_returns()
{
    TWConfig config;
    // No watchdog: nothing in the child can stop the loop.
    config.setCollectorTimeoutMillis(0);
    volatile size_t spins = 0;
    auto spinner = std::make_shared<Custom>([&spins]() {
        for (;;) {
            spins = spins + 1;
        }
    });
    auto r = TWIsolatedRunner::run(document(), spinner, 200, config);
    assert(r.status == TWIsolatedResult::st_timeout);
    assert(std::string(TWIsolatedResult::statusName(r.status)) == "timeout");
    assert(r.exit_code == SIGKILL);
    assert(r.duration_ms >= 200);
    assert(r.duration_ms < 10'000);
    assert(r.message.find("200 ms") != std::string::npos);
    check_failure_result(r, "timeout");
    // The loop ran in the child only.
    assert(spinner->calls == 0);
    assert(spins == 0);
    std::cout << "expected: " << r.message << std::endl;

    // The caller can carry on with another run.
    auto again = TWIsolatedRunner::run(document(), std::make_shared<Cl_Links>(config), 5'000);
    assert(again.status == TWIsolatedResult::st_ok);
}

static void
test_errors_and_crashes()
{
    auto nothing = []() {};

    auto bad = TWIsolatedRunner::run(document(), std::make_shared<Custom>(nothing, true), 5'000);
    assert(bad.status == TWIsolatedResult::st_error);
    assert(bad.exit_code == TWIsolatedRunner::exit_collector_error);
    assert(bad.message == "no interest available");
    check_failure_result(bad, "exception");

    TWConfig small;
    small.setMaxTokens(1);
    auto setup =
        TWIsolatedRunner::run(document(), std::make_shared<Custom>(nothing), 5'000, small);
    assert(setup.status == TWIsolatedResult::st_error);
    assert(setup.exit_code == TWIsolatedRunner::exit_setup_error);
    assert(!setup.message.empty());

    auto crash = TWIsolatedRunner::run(
        document(), std::make_shared<Custom>([]() { std::abort(); }), 5'000);
    assert(crash.status == TWIsolatedResult::st_crashed);
    assert(crash.exit_code == SIGABRT);
    check_failure_result(crash, "exception");

    // A collector exception inside the warehouse's boundary is part of a normal result.
    auto thrower = std::make_shared<Custom>([]() { throw std::runtime_error("boom"); });
    auto caught = TWIsolatedRunner::run(document(), thrower, 5'000);
    assert(caught.status == TWIsolatedResult::st_ok);
    assert(caught.result.getDictItem("errors").size() == 1);

    try {
        TWIsolatedRunner::run(document(), std::make_shared<Custom>(nothing), 0);
        assert(false);
    } catch (std::logic_error&) {
    }
}

#endif

int
main()
{
#ifdef _WIN32
    try {
        TWIsolatedRunner::run(document(), std::make_shared<Cl_Links>(TWConfig()), 1'000);
        assert(false);
    } catch (TWExc& e) {
        assert(e.getErrorCode() == tokwh_e_system);
    }
#else
    test_same_result_as_in_process();
    test_never_returns();
    test_errors_and_crashes();
#endif
    std::cout << "isolation tests done" << std::endl;
    return 0;
}
