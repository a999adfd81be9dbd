#pragma once
#include <cstdint>
#include <string>
#include <vector>

std::vector<uint8_t> readFile(const std::string& path);
// Whole file as text, without a leading UTF-8 byte order mark.
std::string readTextFile(const std::string& path);
bool writeFile(const std::string& path, const std::vector<uint8_t>& data);
bool writeTextFile(const std::string& path, const std::string& text);
