#include "core/base64.hpp"

#include <openssl/evp.h>

namespace rover {

std::string base64Encode(const unsigned char* data, std::size_t len) {
    if (data == nullptr || len == 0U) {
        return {};
    }
    std::string out(4U * ((len + 2U) / 3U) + 1U, '\0');
    const int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(&out[0]),
        data,
        static_cast<int>(len));
    out.resize(written > 0 ? static_cast<std::size_t>(written) : 0U);
    return out;
}

std::string base64Encode(const std::vector<unsigned char>& data) {
    return base64Encode(data.data(), data.size());
}

bool base64Decode(const std::string& text, std::vector<unsigned char>& out) {
    out.clear();
    if (text.empty()) {
        return true;
    }
    if ((text.size() % 4U) != 0U) {
        return false;
    }
    out.resize(3U * (text.size() / 4U));
    const int n = EVP_DecodeBlock(
        out.data(),
        reinterpret_cast<const unsigned char*>(text.data()),
        static_cast<int>(text.size()));
    if (n < 0) {
        out.clear();
        return false;
    }
    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    std::size_t padding = 0U;
    if (text[text.size() - 1U] == '=') {
        padding++;
        if (text[text.size() - 2U] == '=') {
            padding++;
        }
    }
    out.resize(static_cast<std::size_t>(n) - padding);
    return true;
}

}  // namespace rover
