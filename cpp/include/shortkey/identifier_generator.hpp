#pragma once

#include <cstdint>
#include <string>

namespace shortkey {

/**
 * Source of identifier candidates and audit salts.
 *
 * Implementations must be safe to call from several threads at once.
 */
class IdentifierGenerator {
public:
    virtual ~IdentifierGenerator() = default;

    // A candidate of exactly `length` symbols from the configured charset.
    virtual std::string draw(int length) = 0;

    // Hex-encoded random salt recorded with the attempt for auditing.
    virtual std::string salt(int bytes) = 0;
};

/**
 * Draws every symbol independently from the operating system's secure
 * random source (std::random_device), with rejection sampling so each
 * symbol is uniform over the charset. The salt is never used as entropy.
 */
class SecureIdentifierGenerator : public IdentifierGenerator {
public:
    explicit SecureIdentifierGenerator(std::string charset);

    std::string draw(int length) override;
    std::string salt(int bytes) override;

    const std::string& charset() const { return charset_; }

private:
    uint32_t uniform_index();

    std::string charset_;
    uint32_t rejection_limit_;
};

} // namespace shortkey
