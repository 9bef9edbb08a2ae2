#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Standard base64 (RFC 4648) with '=' padding, used for data URIs and frame events.
namespace base64 {

std::string encode(std::span<const uint8_t> data);

// Whitespace is skipped. Fails on characters outside the alphabet or misplaced padding.
std::expected<std::vector<uint8_t>, std::string> decode(std::string_view text);

} // namespace base64
