#pragma once

#include <string>
#include <string_view>

namespace shortkey {

// Lower-cases a hex digest and checks it has exactly hex_length hex digits.
// Throws InvalidArgumentError otherwise.
std::string normalize_fingerprint(std::string_view fingerprint, size_t hex_length);

bool is_valid_fingerprint(std::string_view fingerprint, size_t hex_length);

// First 128 bits of the digest in 8-4-4-4-12 form.
std::string to_content_uuid(std::string_view fingerprint);

// Short form for log lines.
inline std::string abbreviate(std::string_view fingerprint) {
    return std::string(fingerprint.substr(0, 16)) + (fingerprint.size() > 16 ? "..." : "");
}

// Lower-cases a file extension and ensures a leading dot ("" stays "").
std::string normalize_extension(std::string_view extension);

// identifier + extension, the object name the upload pipeline stores under.
std::string make_storage_key(std::string_view identifier, std::string_view extension);

// Joins a public base URL (trailing slashes dropped) and a storage key.
std::string make_public_url(std::string_view base_url, std::string_view storage_key);

} // namespace shortkey
