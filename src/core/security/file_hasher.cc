#include <array>
#include <core/security/file_hasher.h>
#include <fstream>
#include <memory>
#include <openssl/evp.h>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>
#include <vector>

namespace lanlink::core {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext NewSha256Context() {
    DigestContext mdctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!mdctx || EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialise SHA-256 context");
    }
    return mdctx;
}

std::string FinalizeHex(EVP_MD_CTX* mdctx) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(mdctx, hash.data(), &hash_len) != 1) {
        throw std::runtime_error("Failed to finalise SHA-256 digest");
    }

    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; i++) {
        hex += fmt::format("{:02x}", hash[i]);
    }
    return hex;
}

} // namespace

std::string FileHasher::CalculateFileChecksum(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file for checksum calculation: "
                                 + file_path.string());
    }

    auto mdctx = NewSha256Context();

    constexpr size_t buffer_size = 8192;
    std::vector<char> buffer(buffer_size);

    while (file) {
        file.read(buffer.data(), buffer_size);
        auto bytes_read = static_cast<size_t>(file.gcount());
        if (bytes_read > 0 && EVP_DigestUpdate(mdctx.get(), buffer.data(), bytes_read) != 1) {
            throw std::runtime_error("Failed to update SHA-256 digest");
        }
    }
    if (file.bad()) {
        throw std::runtime_error("Failed to read file for checksum calculation: "
                                 + file_path.string());
    }

    return FinalizeHex(mdctx.get());
}

std::string FileHasher::CalculateDataChecksum(const BinaryData& data) {
    auto mdctx = NewSha256Context();
    if (EVP_DigestUpdate(mdctx.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update SHA-256 digest");
    }
    return FinalizeHex(mdctx.get());
}

} // namespace lanlink::core
