#pragma once
#include <string>
#include <vector>
#include <cstdint>

// Decodes standard (RFC 4648) base64. Line breaks, tabs and spaces are
// skipped; '=' padding may only appear at the end. Throws
// std::invalid_argument on any other character or on a truncated quantum.
std::vector<uint8_t> base64_decode(const std::string& encoded);
