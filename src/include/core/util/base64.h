#pragma once

#include <core/util/binary_data.h>
#include <optional>
#include <string>
#include <string_view>

namespace lanlink::core {

namespace base64 {

std::string Encode(const BinaryData& data);

// Strict decoding: rejects characters outside the standard alphabet, bad padding
// and lengths that are not a multiple of four.
std::optional<BinaryData> Decode(std::string_view text);

} // namespace base64

} // namespace lanlink::core
