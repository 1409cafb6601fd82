#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace mcache {

// format bytes into a human readable string, e.g. 1536 -> "1.50 KB"
std::string readable_size(size_t bytes);

// signed variant used for memory deltas, e.g. -1073741824 -> "-1.00 GB"
std::string readable_size_delta(int64_t bytes);

}  // namespace mcache
