#pragma once
#include "error.hpp"
#include "json_rpc.hpp"
#include <nlohmann/json.hpp>

namespace mcpparse {

// Decoders over an already-parsed value tree. Each one checks its rules in a
// fixed order and returns the first violation; nothing is returned alongside
// an error.

/// string -> String, integer literal within int64 -> Number, null -> Null.
/// Everything else, including any number written with a fraction or exponent
/// (1.0, 1e3) and integers outside int64, is InvalidIdentifier.
[[nodiscard]] DecodeResult<RequestId> decode_id(const nlohmann::json& value);

/// Requires object shape, "jsonrpc" == "2.0", an "id", a string "method",
/// and "params" that is absent, null, or an object.
[[nodiscard]] DecodeResult<Request> decode_request(const nlohmann::json& message);

/// Like decode_request for the envelope, but a missing "id" decodes to null
/// and "result" is required.
[[nodiscard]] DecodeResult<Response> decode_response(const nlohmann::json& message);

[[nodiscard]] DecodeResult<ErrorResponse> decode_error_response(const nlohmann::json& message);

/// Picks the record type from the members present: "method" means a request,
/// "error" without "result" means an error response, anything else a response.
[[nodiscard]] DecodeResult<Message> decode_message(const nlohmann::json& message);

} // namespace mcpparse
