#include <gtest/gtest.h>
#include "mcpparse/json_rpc.hpp"
#include "mcpparse/version.hpp"
#include <nlohmann/json.hpp>

using namespace mcpparse;

TEST(Request, ConstructAndSerialize) {
    Request req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/list";
    req.params = Params{{"cursor", "abc"}};

    nlohmann::json j;
    to_json(j, req);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["method"], "tools/list");
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["params"]["cursor"], "abc");
}

TEST(Request, DefaultsToVersionAndNullId) {
    Request req;
    EXPECT_EQ(req.protocol_version, JSONRPC_VERSION);
    EXPECT_TRUE(is_null_id(req.id));
}

TEST(Request, NoParamsOmitsMember) {
    Request req;
    req.id = RequestId{std::string{"my-id"}};
    req.method = "ping";

    nlohmann::json j;
    to_json(j, req);
    EXPECT_EQ(j["id"], "my-id");
    EXPECT_FALSE(j.contains("params"));
}

TEST(Response, WithResult) {
    Response resp;
    resp.id = RequestId{int64_t{42}};
    resp.result = nlohmann::json{{"ok", true}};

    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 42);
    EXPECT_EQ(j["result"]["ok"], true);
    EXPECT_FALSE(j.contains("error"));
}

TEST(Response, NullResultIsWritten) {
    Response resp;
    nlohmann::json j;
    to_json(j, resp);
    ASSERT_TRUE(j.contains("result"));
    EXPECT_TRUE(j["result"].is_null());
    EXPECT_TRUE(j["id"].is_null());
}

TEST(ErrorResponse, Serialize) {
    auto resp = make_error_response(RequestId{int64_t{1}}, error::MethodNotFound, "Method not found");

    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["error"]["code"], -32601);
    EXPECT_EQ(j["error"]["message"], "Method not found");
    EXPECT_FALSE(j["error"].contains("data"));
    EXPECT_FALSE(j.contains("result"));
}

TEST(ErrorResponse, DataWritten) {
    auto resp = make_error_response(nullptr, error::InvalidParams, "bad", nlohmann::json{{"field", "x"}});
    nlohmann::json j;
    to_json(j, resp);
    EXPECT_TRUE(j["id"].is_null());
    EXPECT_EQ(j["error"]["data"]["field"], "x");
}

TEST(MessageVariant, DispatchesToRecord) {
    Message msg = make_success_response(RequestId{std::string{"r1"}}, nlohmann::json::array());
    nlohmann::json j;
    to_json(j, msg);
    EXPECT_EQ(j["id"], "r1");
    EXPECT_TRUE(j["result"].is_array());
}

TEST(RequestId, IntId) {
    RequestId id = int64_t{123};
    nlohmann::json j;
    to_json(j, id);
    EXPECT_EQ(j, 123);
}

TEST(RequestId, StringId) {
    RequestId id = std::string{"hello"};
    nlohmann::json j;
    to_json(j, id);
    EXPECT_EQ(j, "hello");
}

TEST(RequestId, NullId) {
    RequestId id = nullptr;
    nlohmann::json j = 5;
    to_json(j, id);
    EXPECT_TRUE(j.is_null());
}

TEST(RequestId, StringAndNumberDiffer) {
    EXPECT_NE(RequestId{std::string{"1"}}, RequestId{int64_t{1}});
}

TEST(ErrorObject, Equality) {
    ErrorObject e1{-32601, "Not found", std::nullopt};
    ErrorObject e2{-32601, "Not found", std::nullopt};
    ErrorObject e3{-32600, "Invalid", std::nullopt};
    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(ToErrorResponse, ParseFailure) {
    auto resp = to_error_response(DecodeError::invalid_json("unexpected character"));
    EXPECT_TRUE(is_null_id(resp.id));
    EXPECT_EQ(resp.error.code, error::ParseError);
    EXPECT_EQ(resp.error.message, "Invalid JSON: unexpected character");
    ASSERT_TRUE(resp.error.data.has_value());
    EXPECT_EQ((*resp.error.data)["kind"], "InvalidJson");
    EXPECT_FALSE(resp.error.data->contains("field"));
}

TEST(ToErrorResponse, NamesField) {
    auto resp = to_error_response(DecodeError::missing_field(field::Method));
    EXPECT_EQ(resp.error.code, error::InvalidRequest);
    EXPECT_EQ(resp.error.message, "Missing required field: method");
    EXPECT_EQ((*resp.error.data)["kind"], "MissingField");
    EXPECT_EQ((*resp.error.data)["field"], "method");
}
