#include "shortkey/identifier_generator.hpp"
#include "shortkey/error.hpp"

#include <cstdint>
#include <limits>
#include <random>

namespace shortkey {

namespace {

// One device per thread: std::random_device is not required to be thread-safe.
uint32_t secure_u32() {
    thread_local std::random_device device;
    static_assert(sizeof(std::random_device::result_type) >= sizeof(uint32_t));
    return static_cast<uint32_t>(device());
}

} // namespace

SecureIdentifierGenerator::SecureIdentifierGenerator(std::string charset)
    : charset_(std::move(charset)) {
    SHORTKEY_CHECK_ARGUMENT(charset_.size() >= 2, "charset needs at least two symbols");
    const uint64_t n = charset_.size();
    const uint64_t range = uint64_t{std::numeric_limits<uint32_t>::max()} + 1;
    // Largest multiple of n that fits; draws at or above it are rejected.
    rejection_limit_ = static_cast<uint32_t>((range / n) * n - 1);
}

uint32_t SecureIdentifierGenerator::uniform_index() {
    const uint32_t n = static_cast<uint32_t>(charset_.size());
    for (;;) {
        uint32_t x = secure_u32();
        if (x <= rejection_limit_) {
            return x % n;
        }
    }
}

std::string SecureIdentifierGenerator::draw(int length) {
    SHORTKEY_CHECK_ARGUMENT(length > 0, "identifier length must be positive");
    std::string out;
    out.reserve(static_cast<size_t>(length));
    for (int i = 0; i < length; ++i) {
        out.push_back(charset_[uniform_index()]);
    }
    return out;
}

std::string SecureIdentifierGenerator::salt(int bytes) {
    static const char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<size_t>(bytes) * 2);
    for (int i = 0; i < bytes; ++i) {
        uint8_t b = static_cast<uint8_t>(secure_u32() & 0xFF);
        out.push_back(hex[b >> 4]);
        out.push_back(hex[b & 0x0F]);
    }
    return out;
}

} // namespace shortkey
