#include "fault.hpp"

#include <cstdlib>
#include <iostream>

namespace tapl {

void bounds_fault(std::string_view op, std::uint64_t index,
                  std::uint64_t size) {
    std::cerr << "panic: index out of bounds in list." << op << " (index "
              << index << ", size " << size << ")!" << std::endl;
    std::abort();
}

}  // namespace tapl
