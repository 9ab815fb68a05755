#include "ingest/value_serializer.hpp"
#include "core/error.hpp"
#include "core/timestamp.hpp"
#include "core/utils.hpp"

#include <format>

namespace dbsync {

namespace {

using json = nlohmann::json;

std::string serialize_integer(const std::string& text) {
    const auto v = utils::try_parse_int<int64_t>(utils::trim(text));
    if (!v) throw TransformError(std::format("'{}' is not an integer", text));
    return std::to_string(*v);
}

bool is_special_float(const std::string& s) {
    return s == "NaN" || s == "Infinity" || s == "-Infinity";
}

std::string serialize_float(const std::string& text) {
    const auto trimmed = utils::trim(text);
    if (!is_special_float(trimmed) && !utils::try_parse_double(trimmed)) {
        throw TransformError(std::format("'{}' is not a number", text));
    }
    return trimmed;
}

std::string serialize_bool(const std::string& text) {
    const auto lower = utils::to_lower(utils::trim(text));
    if (lower == "t" || lower == "true" || lower == "1" || lower == "yes" || lower == "y") return "true";
    if (lower == "f" || lower == "false" || lower == "0" || lower == "no" || lower == "n") return "false";
    throw TransformError(std::format("'{}' is not a boolean", text));
}

std::string serialize_timestamp(const std::string& text) {
    auto normalized = timestamp::normalize(text);
    if (!normalized) throw TransformError(std::format("'{}' is not a valid timestamp", text));
    return std::move(*normalized);
}

std::string serialize_date(const std::string& text) {
    auto normalized = timestamp::normalize_date(utils::trim(text));
    if (!normalized) throw TransformError(std::format("'{}' is not a valid date", text));
    return std::move(*normalized);
}

std::string serialize_json(const std::string& text) {
    const auto doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) throw TransformError("malformed JSON value");
    return doc.dump();
}

json array_element(const std::string& text, GenericColumnType type) {
    if (is_integer_type(type)) {
        const auto v = utils::try_parse_int<int64_t>(text);
        if (!v) throw TransformError(std::format("array element '{}' is not an integer", text));
        return *v;
    }
    if (is_float_type(type)) {
        if (const auto v = utils::try_parse_double(text)) return *v;
        throw TransformError(std::format("array element '{}' is not a number", text));
    }
    if (type == GenericColumnType::BOOLEAN) {
        return serialize_bool(text) == "true";
    }
    if (is_timestamp_type(type)) {
        return serialize_timestamp(text);
    }
    if (is_json_type(type)) {
        const auto doc = json::parse(text, nullptr, false);
        if (doc.is_discarded()) throw TransformError("malformed JSON array element");
        return doc;
    }
    return text;
}

class PgArrayParser {
public:
    PgArrayParser(std::string_view s, GenericColumnType element_type)
        : s_(s), type_(element_type) {}

    json parse() {
        // Optional dimension decoration: [1:3]={...}
        if (!s_.empty() && s_.front() == '[') {
            const auto eq = s_.find('=');
            if (eq == std::string_view::npos) fail();
            pos_ = eq + 1;
        }
        auto result = parse_array();
        skip_ws();
        if (pos_ != s_.size()) fail();
        return result;
    }

private:
    [[noreturn]] void fail() const {
        throw TransformError(std::format("malformed array literal '{}'", s_));
    }

    void skip_ws() {
        while (pos_ < s_.size() && (s_[pos_] == ' ' || s_[pos_] == '\t')) ++pos_;
    }

    json parse_array() {
        skip_ws();
        if (pos_ >= s_.size() || s_[pos_] != '{') fail();
        ++pos_;
        json arr = json::array();
        skip_ws();
        if (pos_ < s_.size() && s_[pos_] == '}') {
            ++pos_;
            return arr;
        }
        while (true) {
            skip_ws();
            if (pos_ >= s_.size()) fail();
            if (s_[pos_] == '{') {
                arr.push_back(parse_array());
            } else if (s_[pos_] == '"') {
                arr.push_back(array_element(parse_quoted(), type_));
            } else {
                const auto raw = parse_unquoted();
                if (raw == "NULL") {
                    arr.push_back(nullptr);
                } else {
                    arr.push_back(array_element(raw, type_));
                }
            }
            skip_ws();
            if (pos_ >= s_.size()) fail();
            if (s_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (s_[pos_] == '}') {
                ++pos_;
                return arr;
            }
            fail();
        }
    }

    std::string parse_quoted() {
        ++pos_;  // opening quote
        std::string out;
        while (pos_ < s_.size()) {
            const char c = s_[pos_++];
            if (c == '\\') {
                if (pos_ >= s_.size()) fail();
                out += s_[pos_++];
            } else if (c == '"') {
                return out;
            } else {
                out += c;
            }
        }
        fail();
    }

    std::string parse_unquoted() {
        const size_t start = pos_;
        while (pos_ < s_.size() && s_[pos_] != ',' && s_[pos_] != '}') ++pos_;
        auto raw = utils::trim(std::string(s_.substr(start, pos_ - start)));
        if (raw.empty()) fail();
        return raw;
    }

    std::string_view s_;
    GenericColumnType type_;
    size_t pos_ = 0;
};

} // namespace

json parse_pg_array(std::string_view text, GenericColumnType element_type) {
    return PgArrayParser(text, element_type).parse();
}

std::optional<std::string> serialize_value(const SourceField& field) {
    if (!field.text) return std::nullopt;
    const auto& text = *field.text;

    switch (field.type.generic_type) {
        case GenericColumnType::SMALLINT:
        case GenericColumnType::INTEGER:
        case GenericColumnType::BIGINT:
            return serialize_integer(text);
        case GenericColumnType::REAL:
        case GenericColumnType::DOUBLE_PRECISION:
        case GenericColumnType::NUMERIC:
            return serialize_float(text);
        case GenericColumnType::BOOLEAN:
            return serialize_bool(text);
        case GenericColumnType::TIMESTAMP:
        case GenericColumnType::TIMESTAMP_TZ:
            return serialize_timestamp(text);
        case GenericColumnType::DATE:
            return serialize_date(text);
        case GenericColumnType::JSON:
        case GenericColumnType::JSONB:
            return serialize_json(text);
        case GenericColumnType::ARRAY:
            return parse_pg_array(text, field.type.element_type).dump(-1, ' ', false, json::error_handler_t::replace);
        default:
            return text;
    }
}

} // namespace dbsync
