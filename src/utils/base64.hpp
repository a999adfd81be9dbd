#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

//
// RFC 4648 base64, standard alphabet, with padding.
//
// decode_base64 is strict: the input length must be a multiple of four, only alphabet
// characters may appear before the padding, '=' may only end the final quartet, and the
// bits discarded by padding must be zero. Anything else yields std::nullopt.
//
std::optional<std::vector<uint8_t>> decode_base64(const std::string& text);
std::string encode_base64(const std::vector<uint8_t>& data);
