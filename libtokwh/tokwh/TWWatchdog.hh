#ifndef TWWATCHDOG_HH
#define TWWATCHDOG_HH

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

// Time budget for collector calls.
//
// On POSIX systems a Scope installs a SIGALRM handler for the duration of a dispatch or finalize
// pass and restores the previous handler and timer when it goes away. Each Call arms a one-shot
// real-time timer; the handler only sets a flag, which TWDispatchContext::checkDeadline and the
// warehouse inspect. Without POSIX signals (_WIN32) only the steady_clock deadline is used.
//
// Neither mechanism can stop a call that never returns and never checks its deadline.
class TWWatchdog
{
  public:
    // Installs the handler if timeout_ms is non-zero.
    class Scope
    {
      public:
        Scope(uint32_t timeout_ms);
        ~Scope();
        Scope(Scope const&) = delete;
        Scope& operator=(Scope const&) = delete;

      private:
        class Members;
        std::unique_ptr<Members> m;
    };

    // Arms the timer for one collector call and disarms it on destruction.
    class Call
    {
      public:
        Call(uint32_t timeout_ms);
        ~Call();
        Call(Call const&) = delete;
        Call& operator=(Call const&) = delete;

        std::optional<std::chrono::steady_clock::time_point> const&
        deadline() const
        {
            return deadline_;
        }

        // True if the budget was exceeded, either by the signal or by the clock.
        bool expired() const;

      private:
        bool armed{false};
        std::chrono::steady_clock::time_point start;
        std::optional<std::chrono::steady_clock::time_point> deadline_;
    };

    // Set by the signal handler; cleared when a call is armed.
    static bool signalled();

  private:
    TWWatchdog() = delete;
};

#endif // TWWATCHDOG_HH
