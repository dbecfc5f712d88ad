#include "mcpparse/json_rpc.hpp"
#include "mcpparse/version.hpp"

namespace mcpparse {

void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

std::string to_string(const RequestId& id) {
    nlohmann::json j;
    to_json(j, id);
    return j.dump();
}

void to_json(nlohmann::json& j, const Request& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = std::move(id_j);
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void to_json(nlohmann::json& j, const Response& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = std::move(id_j);
    j["result"] = r.result;
}

void to_json(nlohmann::json& j, const ErrorObject& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

void to_json(nlohmann::json& j, const ErrorResponse& r) {
    nlohmann::json id_j;
    to_json(id_j, r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = std::move(id_j);
    j["error"] = r.error;
}

void to_json(nlohmann::json& j, const Message& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

Response make_success_response(RequestId id, nlohmann::json result) {
    Response resp;
    resp.id = std::move(id);
    resp.result = std::move(result);
    return resp;
}

ErrorResponse make_error_response(RequestId id, int32_t code, std::string message,
                                  std::optional<nlohmann::json> data) {
    ErrorResponse resp;
    resp.id = std::move(id);
    resp.error.code = code;
    resp.error.message = std::move(message);
    resp.error.data = std::move(data);
    return resp;
}

ErrorResponse to_error_response(const DecodeError& err) {
    nlohmann::json data = {{"kind", std::string(to_string(err.kind))}};
    if (!err.field.empty()) data["field"] = std::string(err.field);
    return make_error_response(nullptr, err.code(), err.message(), std::move(data));
}

} // namespace mcpparse
