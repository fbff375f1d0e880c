#include <forkjoin-cpp/sort.hpp>
#include <forkjoin-cpp/error.hpp>

#include <limits>
#include <string>

namespace forkjoin_cpp {

auto SortRange::make(std::size_t array_size, std::size_t offset, std::size_t length) -> SortRange {
    if (length > std::numeric_limits<std::size_t>::max() - offset) {
        throw InvalidRangeError{"range offset " + std::to_string(offset) + " + length " +
                                std::to_string(length) + " overflows"};
    }
    if (offset + length > array_size) {
        throw InvalidRangeError{"range [" + std::to_string(offset) + ", " +
                                std::to_string(offset + length) + ") exceeds array of size " +
                                std::to_string(array_size)};
    }
    return SortRange{offset, length};
}

}  // namespace forkjoin_cpp
