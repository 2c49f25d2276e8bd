#include <core/util/base64.h>
#include <openssl/evp.h>

namespace lanlink::core {

namespace base64 {

namespace {

bool IsAlphabet(char ch) {
    return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')
           || ch == '+' || ch == '/';
}

} // namespace

std::string Encode(const BinaryData& data) {
    if (data.empty()) {
        return {};
    }
    std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
    int length = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                                 data.data(),
                                 static_cast<int>(data.size()));
    encoded.resize(static_cast<std::size_t>(length));
    return encoded;
}

std::optional<BinaryData> Decode(std::string_view text) {
    if (text.empty()) {
        return BinaryData{};
    }
    if (text.size() % 4 != 0) {
        return std::nullopt;
    }

    std::size_t padding = 0;
    if (text.back() == '=') {
        ++padding;
        if (text[text.size() - 2] == '=') {
            ++padding;
        }
    }
    for (std::size_t i = 0; i < text.size() - padding; ++i) {
        if (!IsAlphabet(text[i])) {
            return std::nullopt;
        }
    }

    BinaryData decoded(3 * text.size() / 4);
    int length = EVP_DecodeBlock(decoded.data(),
                                 reinterpret_cast<const unsigned char*>(text.data()),
                                 static_cast<int>(text.size()));
    if (length < 0 || static_cast<std::size_t>(length) < padding) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts the zero bytes produced by '=' padding
    decoded.resize(static_cast<std::size_t>(length) - padding);
    return decoded;
}

} // namespace base64

} // namespace lanlink::core
