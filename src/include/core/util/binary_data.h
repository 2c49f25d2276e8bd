#pragma once

#include <cstdint>
#include <vector>

namespace lanlink {

using BinaryData = std::vector<std::uint8_t>;

} // namespace lanlink
