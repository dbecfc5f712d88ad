#pragma once
#include <string_view>

namespace mcpparse {

constexpr std::string_view LIBRARY_VERSION     = "0.3.0";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

} // namespace mcpparse
