#include "file_reader.hpp"
#include "logger.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>

std::vector<uint8_t> readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file " + path);
    }
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(file)),
                                 std::istreambuf_iterator<char>());
}

std::string readTextFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file " + path);
    }
    std::string text((std::istreambuf_iterator<char>(file)),
                     std::istreambuf_iterator<char>());
    // UTF-8 byte order mark is not part of the text
    if (text.compare(0, 3, "\xEF\xBB\xBF") == 0)
        text.erase(0, 3);
    return text;
}

bool writeFile(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream outFile(path, std::ios::binary | std::ios::trunc);
    if (!outFile.is_open()) {
        Logger::error("Cannot open output file " + path);
        return false;
    }
    outFile.write(reinterpret_cast<const char*>(data.data()), data.size());
    if (!outFile) {
        Logger::error("Failed writing " + path);
        return false;
    }
    return true;
}

bool writeTextFile(const std::string& path, const std::string& text) {
    std::ofstream outFile(path, std::ios::binary | std::ios::trunc);
    if (!outFile.is_open()) {
        Logger::error("Cannot open output file " + path);
        return false;
    }
    outFile << text;
    if (!outFile) {
        Logger::error("Failed writing " + path);
        return false;
    }
    return true;
}
