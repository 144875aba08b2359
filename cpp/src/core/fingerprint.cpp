#include "shortkey/fingerprint.hpp"
#include "shortkey/error.hpp"

#include <algorithm>
#include <cctype>

namespace shortkey {

bool is_valid_fingerprint(std::string_view fingerprint, size_t hex_length) {
    if (fingerprint.size() != hex_length) return false;
    return std::all_of(fingerprint.begin(), fingerprint.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::string normalize_fingerprint(std::string_view fingerprint, size_t hex_length) {
    if (!is_valid_fingerprint(fingerprint, hex_length)) {
        throw InvalidArgumentError("fingerprint must be " + std::to_string(hex_length) +
                                   " hex digits, got '" + abbreviate(fingerprint) + "'");
    }
    std::string out(fingerprint);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string to_content_uuid(std::string_view fingerprint) {
    std::string hex(fingerprint.substr(0, 32));
    if (hex.size() < 32) {
        hex.append(32 - hex.size(), '0');
    }
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::string normalize_extension(std::string_view extension) {
    if (extension.empty()) return {};
    std::string out;
    if (extension.front() != '.') out.push_back('.');
    out.append(extension);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string make_storage_key(std::string_view identifier, std::string_view extension) {
    return std::string(identifier) + normalize_extension(extension);
}

std::string make_public_url(std::string_view base_url, std::string_view storage_key) {
    std::string base(base_url);
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/" + std::string(storage_key);
}

} // namespace shortkey
