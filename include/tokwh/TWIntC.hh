// Copyright (c) 2024-2026 The tokwh authors
//
// This file is part of tokwh.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef TWINTC_HH
#define TWINTC_HH

#include <cstddef>
#include <cstdint>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <type_traits>

// Checked integer conversions. Token counts and positions are size_t while line numbers coming
// from untrusted nodes are long long; every conversion between the two goes through here and
// throws std::range_error instead of silently wrapping.

namespace TWIntC // TWIntC = tokwh Integer Conversion
{
    template <typename From, typename To>
    class IntConverter
    {
      public:
        static To
        convert(From const& i)
        {
            if (!fits(i)) {
                std::ostringstream msg;
                msg << "integer out of range converting " << +i << " from a " << sizeof(From)
                    << "-byte " << (std::is_signed_v<From> ? "signed" : "unsigned")
                    << " type to a " << sizeof(To) << "-byte "
                    << (std::is_signed_v<To> ? "signed" : "unsigned") << " type";
                throw std::range_error(msg.str());
            }
            return static_cast<To>(i);
        }

      private:
        static bool
        fits(From const& i)
        {
            if constexpr (std::is_signed_v<From> == std::is_signed_v<To>) {
                return i >= std::numeric_limits<To>::min() && i <= std::numeric_limits<To>::max();
            } else if constexpr (std::is_signed_v<From>) {
                // Negative values never fit; non-negative values compare as unsigned.
                return i >= 0 &&
                    static_cast<std::make_unsigned_t<From>>(i) <= std::numeric_limits<To>::max();
            } else {
                return i <= static_cast<std::make_unsigned_t<To>>(std::numeric_limits<To>::max());
            }
        }
    };

    template <typename T>
    int
    to_int(T const& i)
    {
        return IntConverter<T, int>::convert(i);
    }

    template <typename T>
    unsigned int
    to_uint(T const& i)
    {
        return IntConverter<T, unsigned int>::convert(i);
    }

    template <typename T>
    uint32_t
    to_uint32(T const& i)
    {
        return IntConverter<T, uint32_t>::convert(i);
    }

    template <typename T>
    size_t
    to_size(T const& i)
    {
        return IntConverter<T, size_t>::convert(i);
    }

    template <typename T>
    long long
    to_longlong(T const& i)
    {
        return IntConverter<T, long long>::convert(i);
    }

    template <typename T>
    unsigned long long
    to_ulonglong(T const& i)
    {
        return IntConverter<T, unsigned long long>::convert(i);
    }

    // Clamp instead of throwing. Used where a value comes from an untrusted node and an out of
    // range value is normalized rather than rejected.
    inline long long
    clamp(long long i, long long low, long long high)
    {
        return i < low ? low : (i > high ? high : i);
    }
} // namespace TWIntC

#endif // TWINTC_HH
