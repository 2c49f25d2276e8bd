#pragma once

#include <chrono>
#include <core/util/binary_data.h>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace lanlink::test {

// Fresh directory under the system temp dir, removed with its contents on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path()
                / ("lanlink_test_" + std::to_string(rd()) + "_"
                   + std::to_string(
                       std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline BinaryData PatternBytes(std::size_t size) {
    BinaryData data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>((i * 31 + 7) % 256);
    }
    return data;
}

inline BinaryData ReadAll(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return BinaryData(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void WriteAll(const std::filesystem::path& path, const BinaryData& data) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

} // namespace lanlink::test
