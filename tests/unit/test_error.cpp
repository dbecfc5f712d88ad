#include <gtest/gtest.h>
#include "mcpparse/error.hpp"
#include <sstream>

using namespace mcpparse;

// ---- Messages ----

TEST(DecodeErrorMessage, InvalidJson) {
    auto err = DecodeError::invalid_json("unclosed string");
    EXPECT_EQ(err.kind, DecodeErrorKind::InvalidJson);
    EXPECT_EQ(err.message(), "Invalid JSON: unclosed string");
}

TEST(DecodeErrorMessage, InvalidVersion) {
    auto err = DecodeError::invalid_version("1.0");
    EXPECT_EQ(err.detail, "1.0");
    EXPECT_EQ(err.message(), "Invalid JSON-RPC version: expected '2.0', got '1.0'");
}

TEST(DecodeErrorMessage, MissingField) {
    auto err = DecodeError::missing_field(field::Method);
    EXPECT_EQ(err.field, "method");
    EXPECT_EQ(err.message(), "Missing required field: method");
}

TEST(DecodeErrorMessage, InvalidFieldType) {
    auto err = DecodeError::invalid_field_type(field::Params, expected::ObjectOrNull);
    EXPECT_EQ(err.message(), "Invalid field type for 'params': expected object or null");
}

TEST(DecodeErrorMessage, InvalidIdentifier) {
    EXPECT_EQ(DecodeError::invalid_identifier().message(),
              "Invalid request ID: must be string, number, or null");
}

TEST(DecodeErrorMessage, StreamsMessage) {
    std::ostringstream os;
    os << DecodeError::missing_field(field::Id);
    EXPECT_EQ(os.str(), "Missing required field: id");
}

TEST(DecodeErrorKindName, AllKinds) {
    EXPECT_EQ(to_string(DecodeErrorKind::InvalidJson), "InvalidJson");
    EXPECT_EQ(to_string(DecodeErrorKind::InvalidVersion), "InvalidVersion");
    EXPECT_EQ(to_string(DecodeErrorKind::MissingField), "MissingField");
    EXPECT_EQ(to_string(DecodeErrorKind::InvalidFieldType), "InvalidFieldType");
    EXPECT_EQ(to_string(DecodeErrorKind::InvalidIdentifier), "InvalidIdentifier");
}

// ---- Codes ----

TEST(DecodeErrorCode, SyntaxIsParseError) {
    EXPECT_EQ(DecodeError::invalid_json("x").code(), error::ParseError);
}

TEST(DecodeErrorCode, StructuralIsInvalidRequest) {
    EXPECT_EQ(DecodeError::invalid_version("1.0").code(), error::InvalidRequest);
    EXPECT_EQ(DecodeError::missing_field(field::Id).code(), error::InvalidRequest);
    EXPECT_EQ(DecodeError::invalid_identifier().code(), error::InvalidRequest);
}

TEST(DecodeErrorEquality, ComparesAllParts) {
    EXPECT_EQ(DecodeError::missing_field(field::Id), DecodeError::missing_field(field::Id));
    EXPECT_NE(DecodeError::missing_field(field::Id), DecodeError::missing_field(field::Method));
    EXPECT_NE(DecodeError::invalid_version("1.0"), DecodeError::invalid_version("2.1"));
}

// ---- DecodeResult ----

TEST(DecodeResult, HoldsValue) {
    DecodeResult<int> r{7};
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 7);
    EXPECT_THROW(r.error(), std::logic_error);
}

TEST(DecodeResult, HoldsError) {
    DecodeResult<int> r{DecodeError::missing_field(field::Result)};
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error(), DecodeError::missing_field(field::Result));
}

TEST(DecodeResult, ValueOnErrorThrowsDecodeException) {
    DecodeResult<int> r{DecodeError::invalid_version("3.0")};
    try {
        (void)r.value();
        FAIL() << "expected DecodeException";
    } catch (const DecodeException& e) {
        EXPECT_EQ(e.error().kind, DecodeErrorKind::InvalidVersion);
        EXPECT_STREQ(e.what(), "Invalid JSON-RPC version: expected '2.0', got '3.0'");
    }
}

TEST(DecodeResult, DecodeExceptionIsMcpError) {
    DecodeResult<int> r{DecodeError::invalid_identifier()};
    EXPECT_THROW((void)r.value(), McpError);
    EXPECT_THROW((void)r.value(), std::runtime_error);
}
