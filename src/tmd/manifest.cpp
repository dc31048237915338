#include <tmd/manifest.hpp>
#include <tmd/util/encoding.hpp>

#include <nlohmann/json.hpp>

namespace tmd {

using json = nlohmann::json;

namespace {

// Thrown inside the parsers and converted to INVALID_FORMAT at the boundary
struct SchemaError {
    std::string message;
};

const json& require(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw SchemaError{std::string("missing field '") + key + "'"};
    }
    return *it;
}

std::string get_string(const json& obj, const char* key) {
    const json& v = require(obj, key);
    if (!v.is_string()) {
        throw SchemaError{std::string("field '") + key + "' must be a string"};
    }
    return v.get<std::string>();
}

std::optional<std::string> get_optional_string(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    if (!it->is_string()) {
        throw SchemaError{std::string("field '") + key + "' must be a string or null"};
    }
    return it->get<std::string>();
}

std::vector<std::string> get_string_list(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return {};
    if (!it->is_array()) {
        throw SchemaError{std::string("field '") + key + "' must be an array"};
    }
    std::vector<std::string> out;
    for (const auto& item : *it) {
        if (!item.is_string()) {
            throw SchemaError{std::string("field '") + key + "' must contain only strings"};
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

uint64_t get_unsigned(const json& v, const char* key, uint64_t max) {
    if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<int64_t>() >= 0)) {
        throw SchemaError{std::string("field '") + key + "' must be a non-negative integer"};
    }
    uint64_t value = v.get<uint64_t>();
    if (value > max) {
        throw SchemaError{std::string("field '") + key + "' is out of range"};
    }
    return value;
}

Uuid get_uuid(const json& v, const char* key) {
    if (!v.is_string()) {
        throw SchemaError{std::string("field '") + key + "' must be a UUID string"};
    }
    auto id = Uuid::parse(v.get<std::string>());
    if (!id) {
        throw SchemaError{std::string("field '") + key + "' is not a valid UUID"};
    }
    return *id;
}

Timestamp get_timestamp(const json& obj, const char* key) {
    std::string text = get_string(obj, key);
    auto ts = parse_rfc3339(text);
    if (!ts) {
        throw SchemaError{std::string("field '") + key + "' is not an RFC 3339 timestamp: " + text};
    }
    return *ts;
}

json get_extras(const json& obj) {
    auto it = obj.find("extras");
    if (it == obj.end() || it->is_null()) return json::object();
    if (!it->is_object()) {
        throw SchemaError{"field 'extras' must be an object"};
    }
    return *it;
}

json optional_to_json(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

// Serialize, reporting invalid UTF-8 in any string instead of throwing
Result<std::string> dump_checked(const json& j, const char* what) {
    try {
        return j.dump(2) + "\n";
    } catch (const json::type_error& e) {
        return Error(ErrorCode::INVALID_FORMAT, std::string(what) + " cannot be serialized: " + e.what());
    }
}

}  // namespace

bool is_valid_utf8_json(const nlohmann::json& value) {
    if (value.is_string()) {
        return is_valid_utf8(value.get_ref<const std::string&>());
    }
    if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (!is_valid_utf8(it.key()) || !is_valid_utf8_json(it.value())) {
                return false;
            }
        }
        return true;
    }
    if (value.is_array()) {
        for (const auto& item : value) {
            if (!is_valid_utf8_json(item)) {
                return false;
            }
        }
    }
    return true;
}

Result<Manifest> make_manifest() {
    auto id = Uuid::generate_v4();
    if (!id.ok()) {
        return id.error();
    }

    Manifest manifest;
    manifest.doc_id = id.value();
    manifest.created_utc = now_utc();
    manifest.modified_utc = manifest.created_utc;
    return manifest;
}

Result<std::string> manifest_to_json(const Manifest& m) {
    json j;
    j["tmd_version"] = {
        {"major", m.tmd_version.major},
        {"minor", m.tmd_version.minor},
        {"patch", m.tmd_version.patch},
    };
    j["doc_id"] = m.doc_id.to_string();
    j["title"] = optional_to_json(m.title);
    j["authors"] = m.authors;
    j["created_utc"] = format_rfc3339(m.created_utc);
    j["modified_utc"] = format_rfc3339(m.modified_utc);
    j["tags"] = m.tags;
    j["cover_image"] = m.cover_image ? json{{"id", m.cover_image->to_string()}} : json(nullptr);

    json links = json::array();
    for (const auto& link : m.links) {
        links.push_back({{"rel", link.rel}, {"href", link.href}});
    }
    j["links"] = std::move(links);
    j["db_schema_version"] = m.db_schema_version ? json(*m.db_schema_version) : json(nullptr);
    j["extras"] = m.extras.is_null() ? json::object() : m.extras;

    return dump_checked(j, "manifest.json");
}

Result<Manifest> manifest_from_json(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        return Error(ErrorCode::INVALID_FORMAT,
                     std::string("manifest.json is not valid JSON: ") + e.what());
    }

    Manifest m;
    try {
        if (!j.is_object()) {
            throw SchemaError{"top-level value must be an object"};
        }

        const json& version = require(j, "tmd_version");
        if (!version.is_object()) {
            throw SchemaError{"field 'tmd_version' must be an object"};
        }
        m.tmd_version.major = static_cast<uint16_t>(get_unsigned(require(version, "major"), "major", 0xFFFF));
        m.tmd_version.minor = static_cast<uint16_t>(get_unsigned(require(version, "minor"), "minor", 0xFFFF));
        m.tmd_version.patch = static_cast<uint16_t>(get_unsigned(require(version, "patch"), "patch", 0xFFFF));

        m.doc_id = get_uuid(require(j, "doc_id"), "doc_id");
        m.title = get_optional_string(j, "title");
        m.authors = get_string_list(j, "authors");
        m.created_utc = get_timestamp(j, "created_utc");
        m.modified_utc = get_timestamp(j, "modified_utc");
        m.tags = get_string_list(j, "tags");

        auto cover = j.find("cover_image");
        if (cover != j.end() && !cover->is_null()) {
            if (!cover->is_object()) {
                throw SchemaError{"field 'cover_image' must be an object or null"};
            }
            m.cover_image = get_uuid(require(*cover, "id"), "cover_image.id");
        }

        auto links = j.find("links");
        if (links != j.end() && !links->is_null()) {
            if (!links->is_array()) {
                throw SchemaError{"field 'links' must be an array"};
            }
            for (const auto& link : *links) {
                if (!link.is_object()) {
                    throw SchemaError{"entries of 'links' must be objects"};
                }
                m.links.push_back(LinkRef{get_string(link, "rel"), get_string(link, "href")});
            }
        }

        auto schema = j.find("db_schema_version");
        if (schema != j.end() && !schema->is_null()) {
            m.db_schema_version = static_cast<uint32_t>(
                get_unsigned(*schema, "db_schema_version", 0xFFFFFFFFu));
        }

        m.extras = get_extras(j);
    } catch (const SchemaError& e) {
        return Error(ErrorCode::INVALID_FORMAT, "manifest.json: " + e.message);
    }

    if (m.tmd_version.major != FORMAT_VERSION_MAJOR) {
        return Error(ErrorCode::UNSUPPORTED,
                     "unsupported tmd_version " + m.tmd_version.to_string());
    }
    if (m.modified_utc < m.created_utc) {
        return Error(ErrorCode::INVALID_FORMAT,
                     "manifest.json: modified_utc " + format_rfc3339(m.modified_utc) +
                     " precedes created_utc " + format_rfc3339(m.created_utc));
    }

    return m;
}

AttachmentRecord to_record(const AttachmentMeta& meta, bool include_digest) {
    AttachmentRecord r;
    r.id = meta.id;
    r.logical_path = meta.logical_path;
    r.mime = meta.mime;
    r.length = meta.length;
    if (include_digest) {
        r.sha256 = meta.sha256;
    }
    r.title = meta.title;
    r.alt = meta.alt;
    r.extras = meta.extras;
    return r;
}

Result<std::string> attachment_records_to_json(const std::vector<AttachmentRecord>& records) {
    json list = json::array();
    for (const auto& r : records) {
        list.push_back({
            {"id", r.id.to_string()},
            {"logical_path", r.logical_path},
            {"mime", r.mime},
            {"length", r.length},
            {"sha256", r.sha256 ? json(hex_encode(*r.sha256)) : json(nullptr)},
            {"title", optional_to_json(r.title)},
            {"alt", optional_to_json(r.alt)},
            {"extras", r.extras.is_null() ? json::object() : r.extras},
        });
    }
    json j;
    j["attachments"] = std::move(list);
    return dump_checked(j, "attachments.json");
}

Result<std::vector<AttachmentRecord>> attachment_records_from_json(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        return Error(ErrorCode::INVALID_FORMAT,
                     std::string("attachments.json is not valid JSON: ") + e.what());
    }

    std::vector<AttachmentRecord> records;
    try {
        if (!j.is_object()) {
            throw SchemaError{"top-level value must be an object"};
        }
        const json& list = require(j, "attachments");
        if (!list.is_array()) {
            throw SchemaError{"field 'attachments' must be an array"};
        }

        for (const auto& item : list) {
            if (!item.is_object()) {
                throw SchemaError{"attachment entries must be objects"};
            }
            AttachmentRecord r;
            r.id = get_uuid(require(item, "id"), "id");
            r.logical_path = get_string(item, "logical_path");
            r.mime = get_string(item, "mime");
            r.length = get_unsigned(require(item, "length"), "length", UINT64_MAX);

            auto sha = get_optional_string(item, "sha256");
            if (sha) {
                auto digest = parse_sha256_hex(*sha);
                if (!digest) {
                    throw SchemaError{"attachment '" + r.logical_path + "' has an invalid sha256"};
                }
                r.sha256 = *digest;
            }

            r.title = get_optional_string(item, "title");
            r.alt = get_optional_string(item, "alt");
            r.extras = get_extras(item);
            records.push_back(std::move(r));
        }
    } catch (const SchemaError& e) {
        return Error(ErrorCode::INVALID_FORMAT, "attachments.json: " + e.message);
    }

    return records;
}

}  // namespace tmd
