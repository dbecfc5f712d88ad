#pragma once
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace mcpparse {

/// Member names used by the decoders and reported in MissingField /
/// InvalidFieldType errors.
namespace field {
    constexpr std::string_view Jsonrpc = "jsonrpc";
    constexpr std::string_view Id      = "id";
    constexpr std::string_view Method  = "method";
    constexpr std::string_view Params  = "params";
    constexpr std::string_view Result  = "result";
    constexpr std::string_view Error   = "error";
    constexpr std::string_view Code    = "code";
    constexpr std::string_view Message = "message";
    constexpr std::string_view Data    = "data";
} // namespace field

/// Expected-type descriptions carried by InvalidFieldType.
namespace expected {
    constexpr std::string_view ObjectOrNull = "object or null";
    constexpr std::string_view Object       = "object";
    constexpr std::string_view Int32        = "32-bit integer";
} // namespace expected

/// Standard JSON-RPC 2.0 error codes.
namespace error {
    constexpr int32_t ParseError     = -32700;
    constexpr int32_t InvalidRequest = -32600;
    constexpr int32_t MethodNotFound = -32601;
    constexpr int32_t InvalidParams  = -32602;
    constexpr int32_t InternalError  = -32603;
} // namespace error

enum class DecodeErrorKind {
    InvalidJson,
    InvalidVersion,
    MissingField,
    InvalidFieldType,
    InvalidIdentifier,
};

std::string_view to_string(DecodeErrorKind kind);

/// First structural rule a message violated.
///
/// `detail` holds the parser diagnostic for InvalidJson and the version string
/// that was found for InvalidVersion. `field` and `expected_type` always point
/// at the static constants above.
struct DecodeError {
    DecodeErrorKind kind = DecodeErrorKind::InvalidJson;
    std::string detail;
    std::string_view field;
    std::string_view expected_type;

    static DecodeError invalid_json(std::string diagnostic);
    static DecodeError invalid_version(std::string found);
    static DecodeError missing_field(std::string_view name);
    static DecodeError invalid_field_type(std::string_view name, std::string_view expected_type);
    static DecodeError invalid_identifier();

    /// Human-readable description, e.g. "Missing required field: method".
    std::string message() const;

    /// JSON-RPC error code a gateway reports for this failure.
    int32_t code() const;

    bool operator==(const DecodeError& o) const {
        return kind == o.kind && detail == o.detail && field == o.field
               && expected_type == o.expected_type;
    }
    bool operator!=(const DecodeError& o) const { return !(*this == o); }
};

std::ostream& operator<<(std::ostream& os, const DecodeError& err);

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Thrown by the throwing decode surface; carries the DecodeError value.
class DecodeException : public McpError {
public:
    explicit DecodeException(DecodeError err)
        : McpError(err.message()), error_(std::move(err)) {}

    const DecodeError& error() const noexcept { return error_; }

private:
    DecodeError error_;
};

/// Either a decoded value or the DecodeError that prevented it.
template<typename T>
class DecodeResult {
public:
    DecodeResult(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    DecodeResult(DecodeError err) : state_(std::in_place_index<1>, std::move(err)) {}

    bool ok() const noexcept { return state_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    /// Throws DecodeException when the result holds an error.
    T& value() & {
        check();
        return std::get<0>(state_);
    }
    const T& value() const& {
        check();
        return std::get<0>(state_);
    }
    T&& value() && {
        check();
        return std::get<0>(std::move(state_));
    }

    /// Throws std::logic_error when the result holds a value.
    const DecodeError& error() const {
        if (ok()) {
            throw std::logic_error("DecodeResult holds a value, not an error");
        }
        return std::get<1>(state_);
    }

private:
    void check() const {
        if (!ok()) throw DecodeException(std::get<1>(state_));
    }

    std::variant<T, DecodeError> state_;
};

} // namespace mcpparse
