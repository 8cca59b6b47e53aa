#pragma once
#include <string_view>

namespace mockmcp {

constexpr std::string_view SERVER_NAME               = "mock-mcp-server";
constexpr std::string_view SERVER_VERSION            = "1.0.0";
constexpr std::string_view DEFAULT_PROTOCOL_VERSION  = "2024-11-05";
constexpr std::string_view JSONRPC_VERSION           = "2.0";

} // namespace mockmcp
