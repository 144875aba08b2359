#include "shortkey/metadata.hpp"
#include "shortkey/error.hpp"

#include <boost/json.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

namespace shortkey {

bool Metadata::valid_key(const std::string& key) {
    if (key.empty() || key.size() > MAX_KEY_LENGTH) return false;
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '.' || c == '-';
    });
}

void Metadata::set(const std::string& key, Value value) {
    SHORTKEY_CHECK_ARGUMENT(valid_key(key), "invalid metadata key '" + key + "'");
    if (fields_.find(key) == fields_.end()) {
        SHORTKEY_CHECK_ARGUMENT(fields_.size() < MAX_FIELDS, "too many metadata fields");
    }
    fields_[key] = std::move(value);
}

void Metadata::add_tag(const std::string& tag) {
    SHORTKEY_CHECK_ARGUMENT(!tag.empty(), "empty tag");
    if (std::find(tags_.begin(), tags_.end(), tag) != tags_.end()) return;
    SHORTKEY_CHECK_ARGUMENT(tags_.size() < MAX_TAGS, "too many tags");
    tags_.push_back(tag);
}

std::optional<Metadata::Value> Metadata::get(const std::string& key) const {
    auto it = fields_.find(key);
    if (it == fields_.end()) return std::nullopt;
    return it->second;
}

std::string Metadata::to_json() const {
    boost::json::object fields;
    for (const auto& [key, value] : fields_) {
        std::visit([&fields, &key](const auto& v) { fields[key] = v; }, value);
    }

    boost::json::array tags;
    for (const auto& tag : tags_) {
        tags.emplace_back(tag);
    }

    boost::json::object root;
    root["fields"] = std::move(fields);
    root["tags"] = std::move(tags);
    return boost::json::serialize(root);
}

Metadata Metadata::from_json(const std::string& text) {
    boost::json::error_code ec;
    boost::json::value root = boost::json::parse(text, ec);
    if (ec) {
        throw InvalidArgumentError("metadata is not valid JSON: " + ec.message());
    }
    SHORTKEY_CHECK_ARGUMENT(root.is_object(), "metadata must be a JSON object");

    Metadata md;
    for (const auto& member : root.as_object()) {
        const std::string name(member.key());
        if (name == "fields") {
            SHORTKEY_CHECK_ARGUMENT(member.value().is_object(), "metadata.fields must be an object");
            for (const auto& field : member.value().as_object()) {
                const std::string key(field.key());
                const auto& v = field.value();
                if (v.is_string()) {
                    md.set(key, std::string(v.as_string()));
                } else if (v.is_int64()) {
                    md.set(key, v.as_int64());
                } else if (v.is_uint64()) {
                    SHORTKEY_CHECK_ARGUMENT(v.as_uint64() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()),
                                            "metadata field '" + key + "' is out of integer range");
                    md.set(key, static_cast<int64_t>(v.as_uint64()));
                } else if (v.is_double()) {
                    md.set(key, v.as_double());
                } else if (v.is_bool()) {
                    md.set(key, v.as_bool());
                } else {
                    throw InvalidArgumentError("metadata field '" + key + "' must be a scalar");
                }
            }
        } else if (name == "tags") {
            SHORTKEY_CHECK_ARGUMENT(member.value().is_array(), "metadata.tags must be an array");
            for (const auto& tag : member.value().as_array()) {
                SHORTKEY_CHECK_ARGUMENT(tag.is_string(), "metadata tags must be strings");
                md.add_tag(std::string(tag.as_string()));
            }
        } else {
            throw InvalidArgumentError("unknown metadata member '" + name + "'");
        }
    }
    return md;
}

} // namespace shortkey
