#include "hubagent/util/base64.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>

namespace hubagent {

namespace {

bool IsStdAlphabet(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '/';
}

bool IsUrlAlphabet(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_';
}

// EVP_DecodeBlock maps '=' to zero bits and does not enforce its position,
// so the input shape is checked here before handing it to OpenSSL.
std::string ValidateStd(std::string_view in, size_t& padding) {
    padding = 0;
    if (in.size() % 4 != 0) {
        return "illegal base64 data: length " + std::to_string(in.size()) +
               " is not a multiple of 4";
    }
    while (padding < 2 && padding < in.size() && in[in.size() - 1 - padding] == '=') {
        ++padding;
    }
    for (size_t i = 0; i < in.size() - padding; ++i) {
        if (!IsStdAlphabet(static_cast<unsigned char>(in[i]))) {
            return "illegal base64 data at input byte " + std::to_string(i);
        }
    }
    return {};
}

} // namespace

std::string Base64Encode(std::span<const std::uint8_t> data) {
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(),
                                  static_cast<int>(data.size()));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

std::expected<std::vector<std::uint8_t>, std::string> Base64Decode(std::string_view in) {
    size_t padding = 0;
    if (auto err = ValidateStd(in, padding); !err.empty()) {
        return std::unexpected(err);
    }
    if (in.empty()) return std::vector<std::uint8_t>{};

    std::vector<std::uint8_t> out(in.size() / 4 * 3);
    const int n = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(in.data()),
                                  static_cast<int>(in.size()));
    if (n < 0 || static_cast<size_t>(n) < padding) {
        return std::unexpected("illegal base64 data");
    }
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

std::string Base64RawUrlEncode(std::span<const std::uint8_t> data) {
    std::string out = Base64Encode(data);
    while (!out.empty() && out.back() == '=') out.pop_back();
    std::replace(out.begin(), out.end(), '+', '-');
    std::replace(out.begin(), out.end(), '/', '_');
    return out;
}

std::expected<std::vector<std::uint8_t>, std::string> Base64RawUrlDecode(std::string_view in) {
    if (in.size() % 4 == 1) {
        return std::unexpected("illegal base64 data: truncated input of length " +
                               std::to_string(in.size()));
    }

    std::string std_form;
    std_form.reserve(in.size() + 2);
    for (size_t i = 0; i < in.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(in[i]);
        if (!IsUrlAlphabet(c)) {
            return std::unexpected("illegal base64 data at input byte " + std::to_string(i));
        }
        std_form.push_back(c == '-' ? '+' : c == '_' ? '/' : static_cast<char>(c));
    }
    while (std_form.size() % 4 != 0) std_form.push_back('=');

    return Base64Decode(std_form);
}

} // namespace hubagent
