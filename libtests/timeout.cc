#include <tokwh/assert_test.h>

#include <tokwh/TWExc.hh>
#include <tokwh/TokenWarehouse.hh>

#include <chrono>
#include <functional>
#include <iostream>

#ifndef _WIN32
# include <csignal>
#endif

namespace
{
    typedef std::chrono::steady_clock clock_type;

    // Keeps the test from hanging if the deadline never arrives.
    auto constexpr give_up = std::chrono::seconds(10);

    class Slow: public TWCollector
    {
      public:
        Slow(std::function<void(TWDispatchContext&)> work, bool slow_finalize = false) :
            work(std::move(work)),
            slow_finalize(slow_finalize)
        {
        }
        ~Slow() override = default;

        std::string
        getName() const override
        {
            return "slow";
        }
        TWInterest
        getInterest() const override
        {
            return {{"a"}, {}};
        }
        void
        onToken(size_t, TWTokenView const&, TWDispatchContext& ctx, TokenWarehouse&) override
        {
            ++calls;
            if (!slow_finalize) {
                work(ctx);
            }
        }
        JSON
        finalize(TokenWarehouse&) override
        {
            if (slow_finalize) {
                TWDispatchContext ctx;
                work(ctx);
            }
            return JSON::makeDictionary();
        }
        size_t
        itemCount() const override
        {
            return 0;
        }

        std::function<void(TWDispatchContext&)> work;
        bool slow_finalize;
        size_t calls{0};
    };

    // Cooperative: loops until checkDeadline throws.
    void
    check_loop(TWDispatchContext& ctx)
    {
        auto start = clock_type::now();
        while (clock_type::now() - start < give_up) {
            ctx.checkDeadline();
        }
    }

    // Uncooperative: never checks, returns late.
    void
    busy_wait(TWDispatchContext&)
    {
        auto start = clock_type::now();
        while (clock_type::now() - start < std::chrono::milliseconds(150)) {
        }
    }

    std::vector<TWTokenView>
    tokens(size_t n)
    {
        return std::vector<TWTokenView>(
            n, TWTokenView("a", 0, "", std::nullopt, std::nullopt, "", std::nullopt));
    }

    std::shared_ptr<TWLogger>
    quiet_logger()
    {
        auto l = TWLogger::create();
        l->setWarn(l->discard());
        return l;
    }
} // namespace

static void
test_cooperative()
{
    TWConfig config;
    config.setCollectorTimeoutMillis(50);
    TokenWarehouse wh(tokens(3), config, "", quiet_logger());
    auto slow = std::make_shared<Slow>(check_loop);
    wh.registerCollector(slow);
    auto start = clock_type::now();
    wh.dispatchAll();
    auto elapsed = clock_type::now() - start;
    // Every call was cut short and the next one still ran.
    assert(slow->calls == 3);
    assert(elapsed < give_up);
    auto const& errors = wh.getErrors();
    assert(errors.size() == 3);
    for (size_t i = 0; i < errors.size(); ++i) {
        assert(errors.at(i).kind == "timeout");
        assert(errors.at(i).exception_type == "TWExc");
        assert(errors.at(i).token_index == i);
    }
    assert(wh.getWarnings().at(0).getErrorCode() == tokwh_e_collector_timeout);
    auto results = wh.finalizeAll();
    assert(results["slow"].getDictItem("errors").size() == 3);
}

static void
test_late_return()
{
    TWConfig config;
    config.setCollectorTimeoutMillis(20);
    TokenWarehouse wh(tokens(2), config, "", quiet_logger());
    wh.registerCollector(std::make_shared<Slow>(busy_wait));
    wh.dispatchAll();
    auto const& errors = wh.getErrors();
    assert(errors.size() == 2);
    assert(errors.at(0).kind == "timeout");
    assert(errors.at(0).exception_type == "timeout");

    // In finalize
    TokenWarehouse wh2(tokens(1), config, "", quiet_logger());
    wh2.registerCollector(std::make_shared<Slow>(busy_wait, true));
    wh2.dispatchAll();
    assert(wh2.getErrors().empty());
    auto results = wh2.finalizeAll();
    assert(wh2.getErrors().size() == 1);
    assert(!wh2.getErrors().at(0).token_index);
    assert(results["slow"].getDictItem("items").size() == 0);
}

static void
test_strict()
{
    TWConfig config;
    config.setCollectorTimeoutMillis(20).setStrict(true);
    TokenWarehouse wh(tokens(2), config);
    auto slow = std::make_shared<Slow>(check_loop);
    wh.registerCollector(slow);
    try {
        wh.dispatchAll();
        assert(false);
    } catch (TWExc& e) {
        assert(e.getErrorCode() == tokwh_e_collector_timeout);
        std::cout << "expected: " << e.what() << "\n";
    }
    assert(slow->calls == 1);
    assert(wh.getState() == TokenWarehouse::st_finalized);
}

static void
test_disabled()
{
    TWConfig config;
    config.setCollectorTimeoutMillis(0);
    TokenWarehouse wh(tokens(1), config);
    size_t checks = 0;
    wh.registerCollector(std::make_shared<Slow>([&checks](TWDispatchContext& ctx) {
        auto start = clock_type::now();
        while (clock_type::now() - start < std::chrono::milliseconds(30)) {
            ctx.checkDeadline();
            ++checks;
        }
    }));
    wh.dispatchAll();
    assert(checks > 0);
    assert(wh.getErrors().empty());

    // Outside a collector call there is no deadline.
    TWDispatchContext ctx;
    ctx.checkDeadline();
}

#ifndef _WIN32
namespace
{
    volatile sig_atomic_t own_alarms = 0;

    void
    own_handler(int)
    {
        own_alarms = own_alarms + 1;
    }
} // namespace

static void
test_handler_restored()
{
    struct sigaction action{};
    action.sa_handler = own_handler;
    sigemptyset(&action.sa_mask);
    assert(sigaction(SIGALRM, &action, nullptr) == 0);

    TWConfig config;
    config.setCollectorTimeoutMillis(20);
    TokenWarehouse wh(tokens(1), config, "", quiet_logger());
    wh.registerCollector(std::make_shared<Slow>(check_loop));
    wh.dispatchAll();
    assert(wh.getErrors().size() == 1);

    struct sigaction current{};
    assert(sigaction(SIGALRM, nullptr, &current) == 0);
    assert(current.sa_handler == own_handler);
    // The watchdog's alarm went to its own handler.
    assert(own_alarms == 0);

    signal(SIGALRM, SIG_DFL);
}
#endif

int
main()
{
    test_cooperative();
    test_late_return();
    test_strict();
    test_disabled();
#ifndef _WIN32
    test_handler_restored();
#endif
    std::cout << "timeout tests done" << std::endl;
    return 0;
}
