#pragma once
#include "error.hpp"
#include <string_view>
#include <nlohmann/json.hpp>

namespace mcpparse {

/// Parse raw text into a generic value tree.
///
/// Uses simdjson's on-demand parser and copies the document into an
/// nlohmann::json tree that owns all of its data. Any syntax error, invalid
/// UTF-8, or trailing content after the document yields InvalidJson carrying
/// the parser's diagnostic. Never throws for malformed input.
[[nodiscard]] DecodeResult<nlohmann::json> parse_json(std::string_view raw);

} // namespace mcpparse
