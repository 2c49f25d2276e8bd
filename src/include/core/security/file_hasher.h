#pragma once

#include <core/util/binary_data.h>
#include <filesystem>
#include <string>

namespace lanlink::core {

// Lowercase hex SHA-256 digests
class FileHasher {
public:
    static std::string CalculateFileChecksum(const std::filesystem::path& file_path);
    static std::string CalculateDataChecksum(const BinaryData& data);
};

} // namespace lanlink::core
