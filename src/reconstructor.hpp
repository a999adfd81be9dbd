#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Owned, read-only archive bytes produced by reconstruct().
class BinaryArtifact {
public:
    BinaryArtifact() = default;
    explicit BinaryArtifact(std::vector<uint8_t> bytes) : data(std::move(bytes)) {}

    const std::vector<uint8_t>& bytes() const { return data; }
    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }

private:
    std::vector<uint8_t> data;
};

enum class ReconstructError {
    None,
    EmptyInput,       // nothing left after reversing, joining and stripping whitespace
    InvalidEncoding   // not strict RFC 4648 base64
};

struct ReconstructResult {
    ReconstructError error = ReconstructError::None;
    BinaryArtifact artifact;

    bool ok() const { return error == ReconstructError::None; }
};

// Inverts the reversed-line base64 dump: split on "\r\n" or "\n", reverse the line order,
// join, drop all whitespace, then decode.
ReconstructResult reconstruct(const std::string& text);

// Produces the dump reconstruct() reads back. lineWidth 0 keeps everything on one line.
std::string obfuscate(const std::vector<uint8_t>& bytes, size_t lineWidth = 76);

std::string describeError(ReconstructError error);
