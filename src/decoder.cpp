#include "mcpparse/decoder.hpp"
#include "mcpparse/version.hpp"
#include <limits>
#include <optional>
#include <string>

namespace mcpparse {

namespace {

const nlohmann::json* member(const nlohmann::json& obj, std::string_view name) {
    auto it = obj.find(std::string(name));
    return it == obj.end() ? nullptr : &*it;
}

// Object shape and protocol version; shared by every record type.
std::optional<DecodeError> check_envelope(const nlohmann::json& message) {
    if (!message.is_object()) {
        return DecodeError::invalid_json("expected object");
    }
    const auto* version = member(message, field::Jsonrpc);
    if (!version || !version->is_string()) {
        return DecodeError::missing_field(field::Jsonrpc);
    }
    const auto& found = version->get_ref<const std::string&>();
    if (found != JSONRPC_VERSION) {
        return DecodeError::invalid_version(found);
    }
    return std::nullopt;
}

// Responses tolerate a missing id and report it as null.
DecodeResult<RequestId> optional_id(const nlohmann::json& message) {
    const auto* id = member(message, field::Id);
    if (!id) return RequestId{nullptr};
    return decode_id(*id);
}

bool fits_int32(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max());
    }
    if (value.is_number_integer()) {
        auto v = value.get<int64_t>();
        return v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max();
    }
    return false;
}

DecodeResult<Request> request_body(const nlohmann::json& message) {
    const auto* id = member(message, field::Id);
    if (!id) {
        return DecodeError::missing_field(field::Id);
    }
    auto decoded_id = decode_id(*id);
    if (!decoded_id) {
        return decoded_id.error();
    }

    const auto* method = member(message, field::Method);
    if (!method || !method->is_string()) {
        return DecodeError::missing_field(field::Method);
    }

    Request req;
    req.protocol_version = std::string(JSONRPC_VERSION);
    req.id = std::move(decoded_id).value();
    req.method = method->get<std::string>();

    const auto* params = member(message, field::Params);
    if (params && !params->is_null()) {
        if (!params->is_object()) {
            return DecodeError::invalid_field_type(field::Params, expected::ObjectOrNull);
        }
        req.params = params->get<Params>();
    }
    return req;
}

DecodeResult<Response> response_body(const nlohmann::json& message) {
    auto id = optional_id(message);
    if (!id) {
        return id.error();
    }

    const auto* result = member(message, field::Result);
    if (!result) {
        return DecodeError::missing_field(field::Result);
    }

    Response resp;
    resp.protocol_version = std::string(JSONRPC_VERSION);
    resp.id = std::move(id).value();
    resp.result = *result;
    return resp;
}

DecodeResult<ErrorResponse> error_response_body(const nlohmann::json& message) {
    auto id = optional_id(message);
    if (!id) {
        return id.error();
    }

    const auto* error = member(message, field::Error);
    if (!error) {
        return DecodeError::missing_field(field::Error);
    }
    if (!error->is_object()) {
        return DecodeError::invalid_field_type(field::Error, expected::Object);
    }

    const auto* code = member(*error, field::Code);
    if (!code) {
        return DecodeError::missing_field(field::Code);
    }
    if (!fits_int32(*code)) {
        return DecodeError::invalid_field_type(field::Code, expected::Int32);
    }

    const auto* text = member(*error, field::Message);
    if (!text || !text->is_string()) {
        return DecodeError::missing_field(field::Message);
    }

    ErrorResponse resp;
    resp.protocol_version = std::string(JSONRPC_VERSION);
    resp.id = std::move(id).value();
    resp.error.code = code->get<int32_t>();
    resp.error.message = text->get<std::string>();
    // An explicit "data": null is kept as a present null value.
    if (const auto* data = member(*error, field::Data)) {
        resp.error.data = *data;
    }
    return resp;
}

} // anonymous namespace

DecodeResult<RequestId> decode_id(const nlohmann::json& value) {
    if (value.is_string()) {
        return RequestId{value.get<std::string>()};
    }
    if (value.is_number_unsigned()) {
        auto v = value.get<uint64_t>();
        if (v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return DecodeError::invalid_identifier();
        }
        return RequestId{static_cast<int64_t>(v)};
    }
    if (value.is_number_integer()) {
        return RequestId{value.get<int64_t>()};
    }
    // A double may already be rounded; even 1.0 is rejected.
    if (value.is_number_float()) {
        return DecodeError::invalid_identifier();
    }
    if (value.is_null()) {
        return RequestId{nullptr};
    }
    return DecodeError::invalid_identifier();
}

DecodeResult<Request> decode_request(const nlohmann::json& message) {
    if (auto err = check_envelope(message)) {
        return *err;
    }
    return request_body(message);
}

DecodeResult<Response> decode_response(const nlohmann::json& message) {
    if (auto err = check_envelope(message)) {
        return *err;
    }
    return response_body(message);
}

DecodeResult<ErrorResponse> decode_error_response(const nlohmann::json& message) {
    if (auto err = check_envelope(message)) {
        return *err;
    }
    return error_response_body(message);
}

DecodeResult<Message> decode_message(const nlohmann::json& message) {
    if (auto err = check_envelope(message)) {
        return *err;
    }

    if (member(message, field::Method)) {
        auto req = request_body(message);
        if (!req) return req.error();
        return Message{std::move(req).value()};
    }
    if (member(message, field::Error) && !member(message, field::Result)) {
        auto resp = error_response_body(message);
        if (!resp) return resp.error();
        return Message{std::move(resp).value()};
    }
    auto resp = response_body(message);
    if (!resp) return resp.error();
    return Message{std::move(resp).value()};
}

} // namespace mcpparse
