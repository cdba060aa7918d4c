#include <tokwh/TWWatchdog.hh>

#ifndef _WIN32
# include <csignal>
# include <sys/time.h>
#endif

#include <stdexcept>

namespace
{
#ifndef _WIN32
    volatile sig_atomic_t alarm_flag = 0;
    bool handler_installed = false;

    void
    on_alarm(int)
    {
        alarm_flag = 1;
    }

    void
    set_timer(uint32_t timeout_ms)
    {
        itimerval value{};
        value.it_value.tv_sec = static_cast<time_t>(timeout_ms / 1000);
        value.it_value.tv_usec = static_cast<suseconds_t>((timeout_ms % 1000) * 1000);
        if (setitimer(ITIMER_REAL, &value, nullptr) != 0) {
            throw std::runtime_error("setitimer failed");
        }
    }
#endif
} // namespace

class TWWatchdog::Scope::Members
{
  public:
    bool active{false};
#ifndef _WIN32
    struct sigaction old_action{};
    itimerval old_timer{};
#endif
};

TWWatchdog::Scope::Scope(uint32_t timeout_ms) :
    m(std::make_unique<Members>())
{
#ifndef _WIN32
    if (timeout_ms == 0) {
        return;
    }
    struct sigaction action{};
    action.sa_handler = on_alarm;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    if (sigaction(SIGALRM, &action, &m->old_action) != 0) {
        throw std::runtime_error("unable to install SIGALRM handler");
    }
    itimerval off{};
    if (setitimer(ITIMER_REAL, &off, &m->old_timer) != 0) {
        sigaction(SIGALRM, &m->old_action, nullptr);
        throw std::runtime_error("setitimer failed");
    }
    m->active = true;
    handler_installed = true;
#else
    (void)timeout_ms;
#endif
}

TWWatchdog::Scope::~Scope()
{
#ifndef _WIN32
    if (m->active) {
        itimerval off{};
        setitimer(ITIMER_REAL, &off, nullptr);
        sigaction(SIGALRM, &m->old_action, nullptr);
        // Restores the timer of an enclosing scope, if any.
        setitimer(ITIMER_REAL, &m->old_timer, nullptr);
        handler_installed = false;
    }
#endif
}

TWWatchdog::Call::Call(uint32_t timeout_ms) :
    start(std::chrono::steady_clock::now())
{
    if (timeout_ms == 0) {
        return;
    }
    deadline_ = start + std::chrono::milliseconds(timeout_ms);
#ifndef _WIN32
    alarm_flag = 0;
    if (handler_installed) {
        set_timer(timeout_ms);
        armed = true;
    }
#endif
}

TWWatchdog::Call::~Call()
{
#ifndef _WIN32
    if (armed) {
        itimerval off{};
        setitimer(ITIMER_REAL, &off, nullptr);
    }
#endif
}

bool
TWWatchdog::Call::expired() const
{
    if (!deadline_) {
        return false;
    }
    return signalled() || std::chrono::steady_clock::now() >= *deadline_;
}

bool
TWWatchdog::signalled()
{
#ifndef _WIN32
    return alarm_flag != 0;
#else
    return false;
#endif
}
