#pragma once
// ═══════════════════════════════════════════════════════════════════
//  batchql/json_utils.h — JSON values shared by resolvers and loaders
// ═══════════════════════════════════════════════════════════════════
//  Source objects, field arguments, resolver results and batch inputs
//  are all nlohmann::json underneath. JsonValue is the ergonomic face
//  handed to user code.
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <concepts>
#include <string>
#include <type_traits>

namespace batchql {

// ─────────────────────────────────────────────
//  Macro: BATCHQL_SERIALIZE
//  Makes a struct convertible to and from JSON, so it can be returned
//  from a resolver or compared against a batch input.
//
//    struct Owner {
//        std::string name;
//        BATCHQL_SERIALIZE(Owner, name)
//    };
// ─────────────────────────────────────────────
#define BATCHQL_SERIALIZE(Type, ...) \
    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Type, __VA_ARGS__)

template <typename T>
concept JsonSerializable = requires(T t) {
    { nlohmann::json(t) } -> std::convertible_to<nlohmann::json>;
};

// ─────────────────────────────────────────────
//  class JsonValue
//  Read-mostly wrapper over nlohmann::json. Missing keys and
//  out-of-range indexes read as null instead of throwing.
// ─────────────────────────────────────────────
class JsonValue {
public:
    JsonValue() : data_(nlohmann::json::object()) {}
    JsonValue(const nlohmann::json& j) : data_(j) {}
    JsonValue(nlohmann::json&& j) : data_(std::move(j)) {}

    template <JsonSerializable T>
        requires (!std::is_same_v<std::decay_t<T>, nlohmann::json>)
    JsonValue(const T& value) : data_(nlohmann::json(value)) {}

    // ── Subscript Access ──
    JsonValue operator[](const std::string& key) const {
        if (data_.is_object() && data_.contains(key)) {
            return JsonValue(data_[key]);
        }
        return JsonValue(nlohmann::json(nullptr));
    }

    JsonValue operator[](const char* key) const {
        return operator[](std::string(key));
    }

    JsonValue operator[](std::size_t index) const {
        if (data_.is_array() && index < data_.size()) {
            return JsonValue(data_[index]);
        }
        return JsonValue(nlohmann::json(nullptr));
    }

    JsonValue operator[](int index) const {
        return operator[](static_cast<std::size_t>(index));
    }

    // ── Typed Getters ──
    template <typename T>
    T get() const {
        return data_.get<T>();
    }

    template <typename T>
    T get(const std::string& key, const T& defaultValue) const {
        if (data_.is_object() && data_.contains(key)) {
            const auto& v = data_.at(key);
            if (v.is_null()) return defaultValue;
            return v.get<T>();
        }
        return defaultValue;
    }

    // ── Implicit Conversions ──
    operator std::string() const {
        if (data_.is_string()) return data_.get<std::string>();
        return data_.dump();
    }

    operator int() const { return data_.get<int>(); }
    operator double() const { return data_.get<double>(); }

    // ── Inspection ──
    bool isNull() const { return data_.is_null(); }
    bool isObject() const { return data_.is_object(); }
    bool isArray() const { return data_.is_array(); }
    bool isString() const { return data_.is_string(); }
    bool isNumber() const { return data_.is_number(); }
    bool has(const std::string& key) const { return data_.is_object() && data_.contains(key); }
    std::size_t size() const { return data_.size(); }

    std::string dump(int indent = -1) const { return data_.dump(indent); }

    // ── Access underlying nlohmann::json ──
    const nlohmann::json& raw() const { return data_; }
    nlohmann::json& raw() { return data_; }

    auto begin() const { return data_.begin(); }
    auto end() const { return data_.end(); }

    // Structural, not identity: two separately built objects with the
    // same contents compare equal.
    bool operator==(const JsonValue& other) const { return data_ == other.data_; }
    bool operator!=(const JsonValue& other) const { return data_ != other.data_; }

    friend void to_json(nlohmann::json& j, const JsonValue& v) { j = v.data_; }
    friend void from_json(const nlohmann::json& j, JsonValue& v) { v.data_ = j; }

private:
    nlohmann::json data_;
};

} // namespace batchql
