#include "toolgate/json.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace toolgate::json {

Value Value::parse(const std::string& text) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Value{};
    json_object* obj = json_tokener_parse_ex(tok, text.c_str(),
        static_cast<int>(std::min(text.size(), static_cast<size_t>(INT_MAX))));
    json_tokener_error jerr = json_tokener_get_error(tok);
    const size_t end = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Value{};
    }
    // The tokener stops after the first complete value; only whitespace may follow.
    for (size_t i = end; i < text.size(); i++) {
        if (!std::isspace(static_cast<unsigned char>(text[i]))) {
            if (obj) json_object_put(obj);
            return Value{};
        }
    }
    // A literal "null" parses successfully to a NULL json_object.
    if (!obj) return Value{};
    return Value{obj};
}

void Value::set(const std::string& key, const Value& v) {
    if (!is_object()) return;
    json_object_object_add(root_, key.c_str(), v.root_ ? json_object_get(v.root_) : nullptr);
}

Value Value::at(const std::string& key) const {
    if (!is_object()) return Value{};
    json_object* v = nullptr;
    if (!json_object_object_get_ex(root_, key.c_str(), &v) || !v) return Value{};
    return Value(json_object_get(v));
}

bool Value::has(const std::string& key) const {
    if (!is_object()) return false;
    json_object* v = nullptr;
    return json_object_object_get_ex(root_, key.c_str(), &v);
}

size_t Value::size() const {
    if (is_array()) return static_cast<size_t>(json_object_array_length(root_));
    if (is_object()) return static_cast<size_t>(json_object_object_length(root_));
    return 0;
}

Value Value::at(size_t index) const {
    if (!is_array() || index >= size()) return Value{};
    json_object* el = json_object_array_get_idx(root_, index);
    if (!el) return Value{};
    return Value(json_object_get(el));
}

void Value::push_back(const Value& v) {
    if (!is_array()) return;
    json_object_array_add(root_, v.root_ ? json_object_get(v.root_) : nullptr);
}

std::optional<std::string> Value::get_string(const std::string& key) const {
    if (!is_object()) return std::nullopt;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(root_, key.c_str(), &v)) return std::nullopt;
    if (!json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), static_cast<size_t>(json_object_get_string_len(v)));
}

std::optional<int64_t> Value::get_int(const std::string& key) const {
    if (!is_object()) return std::nullopt;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(root_, key.c_str(), &v)) return std::nullopt;
    if (!json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

std::optional<bool> Value::get_bool(const std::string& key) const {
    if (!is_object()) return std::nullopt;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(root_, key.c_str(), &v)) return std::nullopt;
    if (!json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

std::optional<std::string> Value::as_string() const {
    if (!is_string()) return std::nullopt;
    return std::string(json_object_get_string(root_), static_cast<size_t>(json_object_get_string_len(root_)));
}

std::vector<std::string> Value::keys() const {
    std::vector<std::string> out;
    if (!is_object()) return out;
    json_object_object_foreach(root_, k, v) {
        (void)v;
        out.emplace_back(k);
    }
    return out;
}

std::string Value::dump() const {
    if (!root_) return "null";
    return std::string(json_object_to_json_string_ext(root_, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE));
}

std::string Value::dump_pretty() const {
    if (!root_) return "null";
    return std::string(json_object_to_json_string_ext(
        root_, JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_SPACED | JSON_C_TO_STRING_NOSLASHESCAPE));
}

static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            out << quote(keys[i]) << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
        break;
    }
}

std::string Value::dump_canonical() const {
    std::ostringstream out;
    canonical_serialize(root_, out);
    return out.str();
}

std::string quote(const std::string& s) {
    json_object* tmp = json_object_new_string_len(s.c_str(), static_cast<int>(s.size()));
    std::string out = json_object_to_json_string_ext(tmp, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
    json_object_put(tmp);
    return out;
}

} // namespace toolgate::json
