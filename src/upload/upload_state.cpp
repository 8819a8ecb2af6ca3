/**
 * @file upload_state.cpp
 * @brief JSON serialization of upload progress
 */

#include <kcenon/vector_transfer/upload/upload_state.h>

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <sstream>

namespace kcenon::vector_transfer {

// ============================================================================
// JSON helpers (simple implementation without external library)
// ============================================================================

namespace {

auto escape_json_string(const std::string& s) -> std::string {
    std::ostringstream o;
    for (auto c : s) {
        switch (c) {
            case '"': o << "\\\""; break;
            case '\\': o << "\\\\"; break;
            case '\b': o << "\\b"; break;
            case '\f': o << "\\f"; break;
            case '\n': o << "\\n"; break;
            case '\r': o << "\\r"; break;
            case '\t': o << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    o << "\\u" << std::hex << std::setw(4)
                      << std::setfill('0') << static_cast<int>(c);
                } else {
                    o << c;
                }
        }
    }
    return o.str();
}

void append_utf8(std::string& out, unsigned code) {
    if (code < 0x80) {
        out += static_cast<char>(code);
    } else if (code < 0x800) {
        out += static_cast<char>(0xC0 | (code >> 6));
        out += static_cast<char>(0x80 | (code & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (code >> 12));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
    }
}

/**
 * @brief Forward-only reader for the subset of JSON the state files use
 *
 * Objects, arrays, strings and unsigned integers; anything else can only
 * be skipped when it appears under an unknown field.
 */
class json_scanner {
public:
    explicit json_scanner(const std::string& text) : text_(text) {}

    void skip_ws() {
        while (pos_ < text_.size() &&
               std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    auto consume(char expected) -> bool {
        skip_ws();
        if (pos_ < text_.size() && text_[pos_] == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    auto peek() -> char {
        skip_ws();
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    auto at_end() -> bool {
        skip_ws();
        return pos_ >= text_.size();
    }

    auto parse_string() -> std::optional<std::string> {
        if (!consume('"')) {
            return std::nullopt;
        }
        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) {
                return std::nullopt;
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    if (pos_ + 4 > text_.size()) {
                        return std::nullopt;
                    }
                    unsigned code = 0;
                    for (int i = 0; i < 4; ++i) {
                        char h = text_[pos_++];
                        code <<= 4;
                        if (h >= '0' && h <= '9') code |= static_cast<unsigned>(h - '0');
                        else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned>(h - 'a' + 10);
                        else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned>(h - 'A' + 10);
                        else return std::nullopt;
                    }
                    append_utf8(out, code);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;
    }

    auto parse_uint() -> std::optional<uint64_t> {
        skip_ws();
        auto start = pos_;
        uint64_t value = 0;
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            auto digit = static_cast<uint64_t>(text_[pos_] - '0');
            if (value > (UINT64_MAX - digit) / 10) {
                return std::nullopt;
            }
            value = value * 10 + digit;
            ++pos_;
        }
        if (pos_ == start) {
            return std::nullopt;
        }
        return value;
    }

    auto parse_string_array() -> std::optional<std::vector<std::string>> {
        if (!consume('[')) {
            return std::nullopt;
        }
        std::vector<std::string> values;
        if (consume(']')) {
            return values;
        }
        do {
            auto value = parse_string();
            if (!value) {
                return std::nullopt;
            }
            values.push_back(std::move(*value));
        } while (consume(','));
        if (!consume(']')) {
            return std::nullopt;
        }
        return values;
    }

    auto skip_value() -> bool {
        char c = peek();
        if (c == '"') {
            return parse_string().has_value();
        }
        if (c == '{' || c == '[') {
            char close = c == '{' ? '}' : ']';
            ++pos_;
            if (consume(close)) {
                return true;
            }
            do {
                if (c == '{' && (!parse_string() || !consume(':'))) {
                    return false;
                }
                if (!skip_value()) {
                    return false;
                }
            } while (consume(','));
            return consume(close);
        }
        // Literal or number
        auto start = pos_;
        while (pos_ < text_.size() && text_[pos_] != ',' && text_[pos_] != '}' &&
               text_[pos_] != ']' && !std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
        return pos_ > start;
    }

    [[nodiscard]] auto position() const -> std::size_t { return pos_; }

private:
    const std::string& text_;
    std::size_t pos_ = 0;
};

auto corrupted(const std::string& what, const json_scanner& scanner) -> unexpected {
    return unexpected(error{error_code::state_corrupted,
        what + " at offset " + std::to_string(scanner.position())});
}

auto parse_upload_state(json_scanner& scanner) -> result<upload_state> {
    if (!scanner.consume('{')) {
        return corrupted("expected '{'", scanner);
    }

    upload_state state;
    bool has_bucket = false;
    bool has_key = false;
    bool has_upload_id = false;
    bool has_part_size = false;

    if (!scanner.consume('}')) {
        do {
            auto name = scanner.parse_string();
            if (!name || !scanner.consume(':')) {
                return corrupted("expected field name", scanner);
            }

            if (*name == "bucket" || *name == "key" || *name == "upload_id") {
                auto value = scanner.parse_string();
                if (!value) {
                    return corrupted("field '" + *name + "' must be a string", scanner);
                }
                if (*name == "bucket") {
                    state.bucket = std::move(*value);
                    has_bucket = true;
                } else if (*name == "key") {
                    state.key = std::move(*value);
                    has_key = true;
                } else {
                    state.upload_id = std::move(*value);
                    has_upload_id = true;
                }
            } else if (*name == "size_per_upload" || *name == "uploaded_bytes") {
                auto value = scanner.parse_uint();
                if (!value) {
                    return corrupted("field '" + *name + "' must be an unsigned integer", scanner);
                }
                if (*name == "size_per_upload") {
                    state.part_size = *value;
                    has_part_size = true;
                } else {
                    state.uploaded_bytes = *value;
                }
            } else if (*name == "parts") {
                auto value = scanner.parse_string_array();
                if (!value) {
                    return corrupted("field 'parts' must be an array of strings", scanner);
                }
                state.parts = std::move(*value);
            } else if (!scanner.skip_value()) {
                return corrupted("malformed value for field '" + *name + "'", scanner);
            }
        } while (scanner.consume(','));

        if (!scanner.consume('}')) {
            return corrupted("expected '}'", scanner);
        }
    }

    if (!has_bucket || !has_key || !has_upload_id || !has_part_size) {
        return unexpected(error{error_code::state_corrupted,
            "upload state is missing one of bucket, key, upload_id, size_per_upload"});
    }
    return state;
}

void write_upload_state(std::ostringstream& oss, const upload_state& state,
                        const std::string& indent) {
    oss << "{\n";
    oss << indent << "  \"bucket\": \"" << escape_json_string(state.bucket) << "\",\n";
    oss << indent << "  \"key\": \"" << escape_json_string(state.key) << "\",\n";
    oss << indent << "  \"size_per_upload\": " << state.part_size << ",\n";
    oss << indent << "  \"upload_id\": \"" << escape_json_string(state.upload_id) << "\",\n";
    oss << indent << "  \"parts\": [";
    for (std::size_t i = 0; i < state.parts.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << "\"" << escape_json_string(state.parts[i]) << "\"";
    }
    oss << "],\n";
    oss << indent << "  \"uploaded_bytes\": " << state.uploaded_bytes << "\n";
    oss << indent << "}";
}

}  // namespace

// ============================================================================
// upload_state
// ============================================================================

auto upload_state::validate() const -> result<void> {
    if (bucket.empty() || key.empty()) {
        return unexpected(error{error_code::invalid_argument,
            "upload state needs a bucket and a key"});
    }
    if (upload_id.empty()) {
        return unexpected(error{error_code::invalid_argument,
            "upload state of " + bucket + "/" + key + " has no upload id"});
    }
    if (part_size == 0) {
        return unexpected(error{error_code::invalid_argument,
            "upload state of " + bucket + "/" + key + " has a zero part size"});
    }
    return {};
}

auto upload_state::completed_parts() const -> std::vector<completed_part> {
    std::vector<completed_part> result;
    result.reserve(parts.size());
    for (std::size_t i = 0; i < parts.size(); ++i) {
        result.push_back(completed_part{static_cast<uint32_t>(i + 1), parts[i]});
    }
    return result;
}

auto upload_state::to_json() const -> std::string {
    std::ostringstream oss;
    write_upload_state(oss, *this, "");
    return oss.str();
}

auto upload_state::from_json(const std::string& json) -> result<upload_state> {
    json_scanner scanner(json);
    auto state = parse_upload_state(scanner);
    if (!state) {
        return state;
    }
    if (!scanner.at_end()) {
        return corrupted("trailing data after upload state", scanner);
    }
    return state;
}

// ============================================================================
// multi_upload_state
// ============================================================================

auto multi_upload_state::to_json() const -> std::string {
    std::ostringstream oss;
    oss << "{\n  \"uploads\": [";
    for (std::size_t i = 0; i < uploads.size(); ++i) {
        oss << (i == 0 ? "\n    " : ",\n    ");
        write_upload_state(oss, uploads[i], "    ");
    }
    oss << (uploads.empty() ? "]\n}" : "\n  ]\n}");
    return oss.str();
}

auto multi_upload_state::from_json(const std::string& json) -> result<multi_upload_state> {
    json_scanner scanner(json);
    if (!scanner.consume('{')) {
        return corrupted("expected '{'", scanner);
    }

    multi_upload_state state;
    bool has_uploads = false;

    if (!scanner.consume('}')) {
        do {
            auto name = scanner.parse_string();
            if (!name || !scanner.consume(':')) {
                return corrupted("expected field name", scanner);
            }
            if (*name != "uploads") {
                if (!scanner.skip_value()) {
                    return corrupted("malformed value for field '" + *name + "'", scanner);
                }
                continue;
            }

            if (!scanner.consume('[')) {
                return corrupted("field 'uploads' must be an array", scanner);
            }
            has_uploads = true;
            if (!scanner.consume(']')) {
                do {
                    auto upload = parse_upload_state(scanner);
                    if (!upload) {
                        return unexpected(upload.error());
                    }
                    state.uploads.push_back(std::move(upload.value()));
                } while (scanner.consume(','));
                if (!scanner.consume(']')) {
                    return corrupted("expected ']'", scanner);
                }
            }
        } while (scanner.consume(','));

        if (!scanner.consume('}')) {
            return corrupted("expected '}'", scanner);
        }
    }

    if (!has_uploads) {
        return unexpected(error{error_code::state_corrupted,
            "upload set state is missing 'uploads'"});
    }
    if (!scanner.at_end()) {
        return corrupted("trailing data after upload set state", scanner);
    }
    return state;
}

}  // namespace kcenon::vector_transfer
