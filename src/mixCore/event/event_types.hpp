#pragma once

#include "../core/config.hpp"
#include "../core/types.hpp"

#include <etl/array.h>
#include <etl/monostate.h>
#include <etl/variant.h>

namespace mixCore::events {

// Owner-side event names ("beforeSave", "afterValidate", ...)
using event_name_t = string<config::event_name_length>;

// User payload types should be small and trivially copyable.
// The variant covers the common cases without RTTI or heap.
using payload_t = etl::variant<
    etl::monostate,
    i32,
    u32,
    f32,
    bool,
    string32,
    etl::array<u8, 16>
>;

} // namespace mixCore::events
