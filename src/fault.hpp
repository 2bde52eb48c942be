#pragma once

#include <cstdint>
#include <string_view>

namespace tapl {

// Fatal bounds fault of a list operation: reports the operation and index on
// stderr, then aborts. Never returns and is not an exception.
[[noreturn]] void bounds_fault(std::string_view op, std::uint64_t index,
                               std::uint64_t size);

}  // namespace tapl
