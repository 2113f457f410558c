#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace rover {

std::string base64Encode(const unsigned char* data, std::size_t len);
std::string base64Encode(const std::vector<unsigned char>& data);

// Strict decoder; returns false on malformed input.
bool base64Decode(const std::string& text, std::vector<unsigned char>& out);

}  // namespace rover
