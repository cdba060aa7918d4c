#ifndef TOKWH_GLOBAL_PRIVATE_HH
#define TOKWH_GLOBAL_PRIVATE_HH

#include <tokwh/global.hh>

#include <limits>

namespace tokwh::global
{
    class Limits
    {
      public:
        Limits(Limits const&) = delete;
        Limits(Limits&&) = delete;
        Limits& operator=(Limits const&) = delete;
        Limits& operator=(Limits&&) = delete;

        static uint32_t const&
        max_tokens()
        {
            return l.max_tokens_;
        }

        static void
        max_tokens(uint32_t value)
        {
            l.max_tokens_ = value;
        }

        static uint64_t const&
        max_bytes()
        {
            return l.max_bytes_;
        }

        static void
        max_bytes(uint64_t value)
        {
            l.max_bytes_ = value;
        }

        static uint32_t const&
        max_nesting()
        {
            return l.max_nesting_;
        }

        static void
        max_nesting(uint32_t value)
        {
            l.max_nesting_ = value;
        }

        static uint32_t const&
        max_items()
        {
            return l.max_items_;
        }

        static void
        max_items(uint32_t value)
        {
            l.max_items_ = value;
        }

        static uint32_t const&
        collector_timeout_ms()
        {
            return l.collector_timeout_ms_;
        }

        static void
        collector_timeout_ms(uint32_t value)
        {
            l.collector_timeout_ms_ = value;
        }

        /// Record a limit error.
        static void
        error()
        {
            if (l.errors_ < std::numeric_limits<uint32_t>::max()) {
                ++l.errors_;
            }
        }

        static uint32_t const&
        errors()
        {
            return l.errors_;
        }

      private:
        Limits() = default;
        ~Limits() = default;

        static Limits l;

        uint32_t errors_{0};

        uint32_t max_tokens_{500'000};
        uint64_t max_bytes_{10 * 1024 * 1024};
        uint32_t max_nesting_{1'000};
        uint32_t max_items_{10'000};
        uint32_t collector_timeout_ms_{5'000};
    };

    class Options
    {
      public:
        static bool
        strict()
        {
            return o.strict_;
        }

        static void
        strict(bool value)
        {
            o.strict_ = value;
        }

        static bool
        allow_raw_html()
        {
            return o.allow_raw_html_;
        }

        static void
        allow_raw_html(bool value)
        {
            o.allow_raw_html_ = value;
        }

      private:
        static Options o;

        bool strict_{false};
        bool allow_raw_html_{false};
    };
} // namespace tokwh::global

#endif // TOKWH_GLOBAL_PRIVATE_HH
