#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace mcpparse {

class Codec {
public:
    /// Parse and validate a request from raw text.
    [[nodiscard]] static DecodeResult<Request> decode_request(std::string_view raw);

    /// Parse and validate a success response from raw text.
    [[nodiscard]] static DecodeResult<Response> decode_response(std::string_view raw);

    [[nodiscard]] static DecodeResult<ErrorResponse> decode_error_response(std::string_view raw);

    /// Parse raw text and decode it as whichever record its members describe.
    [[nodiscard]] static DecodeResult<Message> decode(std::string_view raw);

    /// Decode every input as a request, in order. Stops at the first failure
    /// and returns that failure alone.
    [[nodiscard]] static DecodeResult<std::vector<Request>>
    decode_request_batch(const std::vector<std::string_view>& raws);

    [[nodiscard]] static DecodeResult<std::vector<Request>>
    decode_request_batch(const std::vector<std::string>& raws);

    /// Cheap admission filter. Rejects input lacking the literal substrings
    /// "jsonrpc" and "2.0" before parsing; otherwise parses and checks that the
    /// top-level "jsonrpc" member is exactly "2.0". The substring scan can pass
    /// input where both strings occur only inside nested values; the parse step
    /// then rejects it.
    [[nodiscard]] static bool is_valid(std::string_view raw);

    /// Throwing variants of decode_request / decode_response.
    /// Throw DecodeException on any decode failure.
    [[nodiscard]] static Request parse_request(std::string_view raw);
    [[nodiscard]] static Response parse_response(std::string_view raw);

    /// Serialize a record to JSON text. indent < 0 gives compact output.
    [[nodiscard]] static std::string serialize(const Message& msg, int indent = -1);
};

} // namespace mcpparse
