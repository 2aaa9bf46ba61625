#pragma once
// ═══════════════════════════════════════════════════════════════════
//  batchql/errors.h — Error taxonomy
// ═══════════════════════════════════════════════════════════════════
//
//    ConfigError     invalid options, raised while the plugin is built
//    SchemaError     a resolver or loader names a missing type/field
//    SyntaxError     query or SDL text that does not parse
//    FieldError      one field at one response path failed
//    ExecutionError  aggregate failure raised by the unscoped entry point
//
// ═══════════════════════════════════════════════════════════════════

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace batchql {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SchemaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class SyntaxError : public std::runtime_error {
public:
    SyntaxError(const std::string& message, std::size_t position)
        : std::runtime_error(message), position_(position) {}

    std::size_t position() const { return position_; }

private:
    std::size_t position_;
};

class FieldError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── Aggregate of the per-field errors of one operation ──
class ExecutionError : public std::runtime_error {
public:
    ExecutionError(const std::string& message, int statusCode,
                   nlohmann::json errors, nlohmann::json data = nullptr)
        : std::runtime_error(message)
        , statusCode_(statusCode)
        , errors_(std::move(errors))
        , data_(std::move(data)) {}

    int statusCode() const { return statusCode_; }
    const nlohmann::json& errors() const { return errors_; }
    const nlohmann::json& data() const { return data_; }

private:
    int statusCode_;
    nlohmann::json errors_;
    nlohmann::json data_;
};

// Message carried by every loader-backed field resolved outside a
// request-scoped operation.
inline constexpr const char* kLoadersRequireReply =
    "loaders only work via Graphql::reply()";

} // namespace batchql
