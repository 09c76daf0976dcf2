#include "base64.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <stdexcept>

namespace b64 {

std::string encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return {};
    // Base64 length is 4*ceil(n/3)
    std::string out;
    out.resize(4 * ((data.size() + 2) / 3));
    int n = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(&out[0]),
        reinterpret_cast<const unsigned char*>(data.data()),
        static_cast<int>(data.size()));
    if (n < 0) throw std::runtime_error("EVP_EncodeBlock failed");
    out.resize(static_cast<size_t>(n));
    return out;
}

std::vector<uint8_t> decode(const std::string& s) {
    // Line breaks from LDIF/PEM folding are not part of the data.
    std::string in;
    in.reserve(s.size());
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) in.push_back(c);
    }
    if (in.empty()) return {};
    // EVP_DecodeBlock only takes whole quartets.
    while (in.size() % 4 != 0) in.push_back('=');

    std::vector<uint8_t> out;
    out.resize(3 * (in.size() / 4));

    int n = EVP_DecodeBlock(
        out.data(),
        reinterpret_cast<const unsigned char*>(in.data()),
        static_cast<int>(in.size()));
    if (n < 0) throw std::runtime_error("invalid base64: " + s);

    // EVP_DecodeBlock doesn't account for '=' padding bytes in returned length.
    size_t pad = 0;
    for (auto it = in.rbegin(); it != in.rend() && *it == '=' && pad < 3; ++it) pad++;

    size_t real = static_cast<size_t>(n);
    real = (pad >= real) ? 0 : real - pad;
    out.resize(real);
    return out;
}

} // namespace b64
