#include "reconstructor.hpp"
#include "base64.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>

namespace {

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        size_t end = nl;
        if (end > start && text[end - 1] == '\r') --end;
        lines.push_back(text.substr(start, end - start));
        start = nl + 1;
    }
    return lines;
}

} // namespace

ReconstructResult reconstruct(const std::string& text) {
    ReconstructResult result;

    std::vector<std::string> lines = splitLines(text);
    std::reverse(lines.begin(), lines.end());

    std::string encoded;
    encoded.reserve(text.size());
    for (const auto& line : lines) {
        for (char c : line) {
            if (!std::isspace(static_cast<unsigned char>(c)))
                encoded += c;
        }
    }

    Logger::debug("Reconstructing from " + std::to_string(lines.size()) + " lines, " +
                  std::to_string(encoded.size()) + " base64 characters");

    if (encoded.empty()) {
        result.error = ReconstructError::EmptyInput;
        return result;
    }

    auto decoded = decode_base64(encoded);
    if (!decoded) {
        result.error = ReconstructError::InvalidEncoding;
        return result;
    }

    result.artifact = BinaryArtifact(std::move(*decoded));
    return result;
}

std::string obfuscate(const std::vector<uint8_t>& bytes, size_t lineWidth) {
    std::string encoded = encode_base64(bytes);
    if (lineWidth == 0 || encoded.empty())
        return encoded + "\n";

    std::vector<std::string> lines;
    for (size_t pos = 0; pos < encoded.size(); pos += lineWidth) {
        lines.push_back(encoded.substr(pos, lineWidth));
    }
    std::reverse(lines.begin(), lines.end());

    std::string out;
    out.reserve(encoded.size() + lines.size());
    for (const auto& line : lines) {
        out += line;
        out += '\n';
    }
    return out;
}

std::string describeError(ReconstructError error) {
    switch (error) {
    case ReconstructError::None:
        return "";
    case ReconstructError::EmptyInput:
        return "Resulting string is empty.";
    case ReconstructError::InvalidEncoding:
        return "Invalid Base64 content. Please ensure the file contains valid Base64 parts.";
    }
    return "An unexpected error occurred during conversion.";
}
