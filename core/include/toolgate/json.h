#pragma once

// json.h
//
// Thin RAII handle over json-c. Tool schemas and call results are passed
// around as opaque documents; this keeps ownership of the underlying
// json_object reference-counted instead of hand-managed at every call site.
//
// Copies share the same json_object (json-c refcount), they do not deep-copy.

#include <json-c/json.h>

#include <climits>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace toolgate::json {

class Value {
public:
    Value() = default;
    // Takes ownership of one reference.
    explicit Value(json_object* owned) : root_(owned) {}

    Value(const Value& other) : root_(other.root_ ? json_object_get(other.root_) : nullptr) {}
    Value& operator=(const Value& other) {
        if (this != &other) {
            json_object* r = other.root_ ? json_object_get(other.root_) : nullptr;
            reset();
            root_ = r;
        }
        return *this;
    }

    Value(Value&& other) noexcept : root_(other.root_) { other.root_ = nullptr; }
    Value& operator=(Value&& other) noexcept {
        if (this != &other) {
            reset();
            root_ = other.root_;
            other.root_ = nullptr;
        }
        return *this;
    }

    ~Value() { reset(); }

    static Value object() { return Value(json_object_new_object()); }
    static Value array() { return Value(json_object_new_array()); }
    static Value string(const std::string& s) {
        return Value(json_object_new_string_len(s.c_str(), static_cast<int>(s.size())));
    }
    static Value integer(int64_t v) { return Value(json_object_new_int64(v)); }
    static Value boolean(bool v) { return Value(json_object_new_boolean(v ? 1 : 0)); }

    // Returns an empty Value when the text is not a single valid JSON document.
    static Value parse(const std::string& text);

    explicit operator bool() const { return root_ != nullptr; }
    json_object* get() const { return root_; }

    bool is_object() const { return root_ && json_object_is_type(root_, json_type_object); }
    bool is_array() const { return root_ && json_object_is_type(root_, json_type_array); }
    bool is_string() const { return root_ && json_object_is_type(root_, json_type_string); }

    // String payload when this is a JSON string.
    std::optional<std::string> as_string() const;

    // Object member names in document order.
    std::vector<std::string> keys() const;

    // Adds (or replaces) a member; the value's reference is shared.
    void set(const std::string& key, const Value& v);

    // Member lookup on objects; empty Value if absent.
    Value at(const std::string& key) const;
    bool has(const std::string& key) const;

    size_t size() const;
    Value at(size_t index) const;
    void push_back(const Value& v);

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<int64_t> get_int(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    // Compact serialization; "null" for an empty Value.
    std::string dump() const;

    // Two-space indented, for terminals.
    std::string dump_pretty() const;

    // Serialization with object keys sorted at every level.
    std::string dump_canonical() const;

private:
    void reset() {
        if (root_) json_object_put(root_);
        root_ = nullptr;
    }

    json_object* root_{nullptr};
};

// Quoted JSON string literal for s.
std::string quote(const std::string& s);

} // namespace toolgate::json
