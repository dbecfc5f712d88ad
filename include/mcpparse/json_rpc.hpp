#pragma once
#include "error.hpp"
#include "version.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace mcpparse {

/// Correlation id. Alternatives are listed in decode precedence:
/// string, then exact 64-bit integer, then null.
using RequestId = std::variant<std::string, int64_t, std::nullptr_t>;

using Params = std::map<std::string, nlohmann::json>;

inline bool is_null_id(const RequestId& id) {
    return std::holds_alternative<std::nullptr_t>(id);
}

// Helper to convert RequestId to json
void to_json(nlohmann::json& j, const RequestId& id);

/// Renders an id for diagnostics: "abc" (quoted), 42, null.
std::string to_string(const RequestId& id);

struct Request {
    std::string protocol_version{JSONRPC_VERSION};
    RequestId id{nullptr};
    std::string method;
    std::optional<Params> params;

    bool operator==(const Request& o) const {
        return protocol_version == o.protocol_version && id == o.id
               && method == o.method && params == o.params;
    }
    bool operator!=(const Request& o) const { return !(*this == o); }
};

struct Response {
    std::string protocol_version{JSONRPC_VERSION};
    RequestId id{nullptr};
    nlohmann::json result;

    bool operator==(const Response& o) const {
        return protocol_version == o.protocol_version && id == o.id && result == o.result;
    }
    bool operator!=(const Response& o) const { return !(*this == o); }
};

struct ErrorObject {
    int32_t code = 0;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const ErrorObject& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
    bool operator!=(const ErrorObject& o) const { return !(*this == o); }
};

struct ErrorResponse {
    std::string protocol_version{JSONRPC_VERSION};
    RequestId id{nullptr};
    ErrorObject error;

    bool operator==(const ErrorResponse& o) const {
        return protocol_version == o.protocol_version && id == o.id && error == o.error;
    }
    bool operator!=(const ErrorResponse& o) const { return !(*this == o); }
};

using Message = std::variant<Request, Response, ErrorResponse>;

void to_json(nlohmann::json& j, const Request& r);
void to_json(nlohmann::json& j, const Response& r);
void to_json(nlohmann::json& j, const ErrorObject& e);
void to_json(nlohmann::json& j, const ErrorResponse& r);
void to_json(nlohmann::json& j, const Message& m);

Response make_success_response(RequestId id, nlohmann::json result);

ErrorResponse make_error_response(RequestId id, int32_t code, std::string message,
                                  std::optional<nlohmann::json> data = std::nullopt);

/// Error response for input that could not be decoded at all. The id is null
/// because no id could be trusted; the DecodeError kind travels in `data`.
ErrorResponse to_error_response(const DecodeError& err);

} // namespace mcpparse
