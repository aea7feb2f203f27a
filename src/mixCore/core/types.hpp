#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <etl/string.h>

namespace mixCore {

// Basic integer types
using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

// Floating point types
using f32 = float;
using f64 = double;

// String types (fixed size, no dynamic allocation)
template<size_t N>
using string = etl::string<N>;

using string32 = etl::string<32>;

// True when text is set and fits a string<N> without being cut short.
// Truncated names would compare equal to unrelated ones.
template<size_t N>
inline bool fits_capacity(const char* text) noexcept {
    return text != nullptr && std::strlen(text) <= N;
}

// Monotonic time in microseconds
using timestamp_t = u64;

}  // namespace mixCore
