#include "mcpparse/error.hpp"
#include "mcpparse/version.hpp"

namespace mcpparse {

std::string_view to_string(DecodeErrorKind kind) {
    switch (kind) {
        case DecodeErrorKind::InvalidJson:       return "InvalidJson";
        case DecodeErrorKind::InvalidVersion:    return "InvalidVersion";
        case DecodeErrorKind::MissingField:      return "MissingField";
        case DecodeErrorKind::InvalidFieldType:  return "InvalidFieldType";
        case DecodeErrorKind::InvalidIdentifier: return "InvalidIdentifier";
    }
    return "Unknown";
}

DecodeError DecodeError::invalid_json(std::string diagnostic) {
    DecodeError err;
    err.kind = DecodeErrorKind::InvalidJson;
    err.detail = std::move(diagnostic);
    return err;
}

DecodeError DecodeError::invalid_version(std::string found) {
    DecodeError err;
    err.kind = DecodeErrorKind::InvalidVersion;
    err.detail = std::move(found);
    return err;
}

DecodeError DecodeError::missing_field(std::string_view name) {
    DecodeError err;
    err.kind = DecodeErrorKind::MissingField;
    err.field = name;
    return err;
}

DecodeError DecodeError::invalid_field_type(std::string_view name, std::string_view expected_type) {
    DecodeError err;
    err.kind = DecodeErrorKind::InvalidFieldType;
    err.field = name;
    err.expected_type = expected_type;
    return err;
}

DecodeError DecodeError::invalid_identifier() {
    DecodeError err;
    err.kind = DecodeErrorKind::InvalidIdentifier;
    return err;
}

std::string DecodeError::message() const {
    switch (kind) {
        case DecodeErrorKind::InvalidJson:
            return "Invalid JSON: " + detail;
        case DecodeErrorKind::InvalidVersion:
            return "Invalid JSON-RPC version: expected '" + std::string(JSONRPC_VERSION)
                   + "', got '" + detail + "'";
        case DecodeErrorKind::MissingField:
            return "Missing required field: " + std::string(field);
        case DecodeErrorKind::InvalidFieldType:
            return "Invalid field type for '" + std::string(field) + "': expected "
                   + std::string(expected_type);
        case DecodeErrorKind::InvalidIdentifier:
            return "Invalid request ID: must be string, number, or null";
    }
    return "Unknown decode error";
}

int32_t DecodeError::code() const {
    return kind == DecodeErrorKind::InvalidJson ? error::ParseError : error::InvalidRequest;
}

std::ostream& operator<<(std::ostream& os, const DecodeError& err) {
    return os << err.message();
}

} // namespace mcpparse
