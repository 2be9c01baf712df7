#pragma once

#include <cstddef>
#include <cstdint>

#include <etl/optional.h>
#include <etl/string.h>

namespace emDelegate {

// Basic integer types
using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

// String types (fixed size, no dynamic allocation)
template<size_t N>
using string = etl::string<N>;

using string32 = etl::string<32>;
using string64 = etl::string<64>;

// Optional types
template<typename T>
using optional = etl::optional<T>;

// Time types (microseconds for precision)
using timestamp_t = u64;

/* Position of a member inside an invocation list */
using member_index_t = u16;
constexpr member_index_t invalid_member_index = 0xFFFF;

/* Outcome of an isolated, member-by-member invocation */
struct invocation_report {
    size_t invoked{0};
    size_t faulted{0};

    constexpr bool all_succeeded() const noexcept { return faulted == 0; }
};

}  // namespace emDelegate
