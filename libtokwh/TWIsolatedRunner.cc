#include <tokwh/TWIsolatedRunner.hh>

#include <tokwh/TWExc.hh>
#include <tokwh/TWLogger.hh>
#include <tokwh/TokenWarehouse.hh>

#include <algorithm>
#include <chrono>
#include <climits>
#include <stdexcept>

#ifndef _WIN32
# include <cerrno>
# include <csignal>
# include <cstring>
# include <poll.h>
# include <sys/wait.h>
# include <unistd.h>
#endif

namespace
{
    typedef std::chrono::steady_clock clock_type;

#ifndef _WIN32
    JSON
    failure_result(std::string const& name, std::string const& kind, std::string const& message)
    {
        TWCollectorError error;
        error.collector = name;
        error.kind = kind;
        error.exception_type = (kind == "timeout") ? "timeout" : "process";
        error.message = message;
        auto result = JSON::makeDictionary();
        result.addDictionaryMember("items", JSON::makeArray());
        result.addDictionaryMember("count", JSON::makeInt(0));
        result.addDictionaryMember("truncated", JSON::makeBool(false));
        result.addDictionaryMember("errors", JSON::makeArray()).addArrayElement(error.getJSON());
        return result;
    }

    TWExc
    system_error(std::string const& what)
    {
        return {tokwh_e_system, "", "", -1, what + ": " + strerror(errno)};
    }

    void
    write_all(int fd, std::string const& data)
    {
        size_t written = 0;
        while (written < data.size()) {
            auto n = write(fd, data.data() + written, data.size() - written);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                // The parent reports a short result.
                return;
            }
            written += static_cast<size_t>(n);
        }
    }

    // Runs in the child. Never returns.
    [[noreturn]] void
    child_main(
        int fd,
        std::vector<TWTokenView> const& tokens,
        std::shared_ptr<TWCollector> const& collector,
        TWConfig const& config,
        std::string const& text)
    {
        auto logger = TWLogger::create();
        logger->setInfo(logger->discard());
        logger->setWarn(logger->discard());
        logger->setError(logger->discard());

        std::unique_ptr<TokenWarehouse> wh;
        try {
            wh = std::make_unique<TokenWarehouse>(tokens, config, text, logger);
        } catch (std::exception& e) {
            write_all(fd, e.what());
            _exit(TWIsolatedRunner::exit_setup_error);
        }
        std::string payload;
        try {
            wh->registerCollector(collector);
            wh->dispatchAll();
            auto results = wh->finalizeAll();
            payload = results[collector->getName()].unparse();
        } catch (std::exception& e) {
            write_all(fd, e.what());
            _exit(TWIsolatedRunner::exit_collector_error);
        }
        write_all(fd, payload);
        close(fd);
        _exit(TWIsolatedRunner::exit_ok);
    }
#endif
} // namespace

char const*
TWIsolatedResult::statusName(status_e status)
{
    switch (status) {
    case st_ok:
        return "ok";
    case st_error:
        return "error";
    case st_timeout:
        return "timeout";
    case st_crashed:
        return "crashed";
    }
    return "unknown";
}

#ifdef _WIN32

TWIsolatedResult
TWIsolatedRunner::run(
    std::vector<TWTokenView> const&,
    std::shared_ptr<TWCollector>,
    uint32_t,
    TWConfig const&,
    std::string const&)
{
    throw TWExc(tokwh_e_system, "", "", -1, "process isolation is not available on this platform");
}

#else

TWIsolatedResult
TWIsolatedRunner::run(
    std::vector<TWTokenView> const& tokens,
    std::shared_ptr<TWCollector> collector,
    uint32_t hard_timeout_ms,
    TWConfig const& config,
    std::string const& text)
{
    if (!collector) {
        throw std::logic_error("TWIsolatedRunner::run called with a null collector");
    }
    if (hard_timeout_ms == 0) {
        throw std::logic_error("TWIsolatedRunner::run called with a zero timeout");
    }
    auto name = collector->getName();

    int fds[2];
    if (pipe(fds) != 0) {
        throw system_error("pipe");
    }
    auto start = clock_type::now();
    pid_t pid = fork();
    if (pid == -1) {
        auto e = system_error("fork");
        close(fds[0]);
        close(fds[1]);
        throw e;
    }
    if (pid == 0) {
        close(fds[0]);
        child_main(fds[1], tokens, collector, config, text);
    }
    close(fds[1]);

    std::string payload;
    bool timed_out = false;
    auto deadline = start + std::chrono::milliseconds(hard_timeout_ms);
    char buf[4096];
    while (true) {
        auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock_type::now())
                .count();
        if (remaining <= 0) {
            timed_out = true;
            break;
        }
        pollfd pfd{fds[0], POLLIN, 0};
        int ready = poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, INT_MAX)));
        if (ready == 0 || (ready < 0 && errno == EINTR)) {
            continue;
        }
        ssize_t n = (ready < 0) ? -1 : read(fds[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto e = system_error("read from collector process");
            close(fds[0]);
            kill(pid, SIGKILL);
            waitpid(pid, nullptr, 0);
            throw e;
        }
        if (n == 0) {
            break;
        }
        payload.append(buf, static_cast<size_t>(n));
    }
    close(fds[0]);
    if (timed_out) {
        kill(pid, SIGKILL);
    }
    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw system_error("waitpid");
        }
    }

    TWIsolatedResult r;
    r.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        clock_type::now() - start)
                        .count();
    if (timed_out) {
        r.status = TWIsolatedResult::st_timeout;
        r.exit_code = SIGKILL;
        r.message = "collector did not finish within " + std::to_string(hard_timeout_ms) +
            " ms; process killed";
    } else if (WIFSIGNALED(status)) {
        r.status = TWIsolatedResult::st_crashed;
        r.exit_code = WTERMSIG(status);
        r.message = "collector process terminated by signal " + std::to_string(r.exit_code);
    } else if (WIFEXITED(status)) {
        r.exit_code = WEXITSTATUS(status);
        if (r.exit_code == exit_ok) {
            try {
                r.result = JSON::parse(payload);
                r.status = TWIsolatedResult::st_ok;
            } catch (std::runtime_error& e) {
                r.status = TWIsolatedResult::st_crashed;
                r.message = std::string("collector process sent a malformed result: ") + e.what();
            }
        } else if (r.exit_code == exit_collector_error || r.exit_code == exit_setup_error) {
            r.status = TWIsolatedResult::st_error;
            r.message = payload;
        } else {
            r.status = TWIsolatedResult::st_crashed;
            r.message = "collector process exited with status " + std::to_string(r.exit_code);
        }
    } else {
        r.status = TWIsolatedResult::st_crashed;
        r.message = "collector process ended in an unknown state";
    }
    if (r.status != TWIsolatedResult::st_ok) {
        r.result = failure_result(
            name, (r.status == TWIsolatedResult::st_timeout) ? "timeout" : "exception", r.message);
    }
    return r;
}

#endif
