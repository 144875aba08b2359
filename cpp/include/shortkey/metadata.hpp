#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace shortkey {

/**
 * Optional structured payload attached to an allocation record.
 *
 * Replaces the untyped metadata/tags blobs: keys are validated, values are
 * scalars only. Serialised as a JSON object {"fields": {...}, "tags": [...]}.
 */
class Metadata {
public:
    using Value = std::variant<std::string, int64_t, double, bool>;

    static constexpr size_t MAX_FIELDS = 64;
    static constexpr size_t MAX_KEY_LENGTH = 64;
    static constexpr size_t MAX_TAGS = 32;

    Metadata() = default;

    // Throws InvalidArgumentError on a malformed key or when a limit is hit.
    void set(const std::string& key, Value value);
    void add_tag(const std::string& tag);

    bool empty() const { return fields_.empty() && tags_.empty(); }
    const std::map<std::string, Value>& fields() const { return fields_; }
    const std::vector<std::string>& tags() const { return tags_; }

    std::optional<Value> get(const std::string& key) const;

    std::string to_json() const;

    // Parses and validates. Unknown top-level members and nested objects are rejected.
    static Metadata from_json(const std::string& text);

    static bool valid_key(const std::string& key);

    bool operator==(const Metadata& other) const {
        return fields_ == other.fields_ && tags_ == other.tags_;
    }

private:
    std::map<std::string, Value> fields_;
    std::vector<std::string> tags_;
};

} // namespace shortkey
