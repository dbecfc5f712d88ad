#include "mcpparse/codec.hpp"
#include "mcpparse/decoder.hpp"
#include "mcpparse/json_tree.hpp"
#include "mcpparse/version.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace mcpparse {

namespace {

constexpr std::string_view kJsonrpcNeedle = "\"jsonrpc\"";
constexpr std::string_view kVersionNeedle = "\"2.0\"";

} // anonymous namespace

DecodeResult<Request> Codec::decode_request(std::string_view raw) {
    auto tree = parse_json(raw);
    if (!tree) return tree.error();
    return mcpparse::decode_request(tree.value());
}

DecodeResult<Response> Codec::decode_response(std::string_view raw) {
    auto tree = parse_json(raw);
    if (!tree) return tree.error();
    return mcpparse::decode_response(tree.value());
}

DecodeResult<ErrorResponse> Codec::decode_error_response(std::string_view raw) {
    auto tree = parse_json(raw);
    if (!tree) return tree.error();
    return mcpparse::decode_error_response(tree.value());
}

DecodeResult<Message> Codec::decode(std::string_view raw) {
    auto tree = parse_json(raw);
    if (!tree) return tree.error();
    return decode_message(tree.value());
}

DecodeResult<std::vector<Request>>
Codec::decode_request_batch(const std::vector<std::string_view>& raws) {
    std::vector<Request> requests;
    requests.reserve(raws.size());
    for (auto raw : raws) {
        auto req = decode_request(raw);
        if (!req) return req.error();
        requests.push_back(std::move(req).value());
    }
    return requests;
}

DecodeResult<std::vector<Request>>
Codec::decode_request_batch(const std::vector<std::string>& raws) {
    std::vector<std::string_view> views(raws.begin(), raws.end());
    return decode_request_batch(views);
}

bool Codec::is_valid(std::string_view raw) {
    // Plain substring scan; see header for the precision gap it leaves.
    if (raw.find(kJsonrpcNeedle) == std::string_view::npos
        || raw.find(kVersionNeedle) == std::string_view::npos) {
        return false;
    }

    auto tree = parse_json(raw);
    if (!tree || !tree.value().is_object()) return false;

    const auto& j = tree.value();
    auto it = j.find(std::string(field::Jsonrpc));
    return it != j.end() && it->is_string()
           && it->get_ref<const std::string&>() == JSONRPC_VERSION;
}

Request Codec::parse_request(std::string_view raw) {
    return decode_request(raw).value();
}

Response Codec::parse_response(std::string_view raw) {
    return decode_response(raw).value();
}

std::string Codec::serialize(const Message& msg, int indent) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump(indent);
}

} // namespace mcpparse
