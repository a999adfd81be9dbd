#pragma once
#include "reconstructor.hpp"
#include "directory_scanner.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

enum class ConversionState {
    Idle,
    Processing,
    Success,
    Error
};

// Everything the front end needs after one conversion request.
struct ConversionOutcome {
    ConversionState state = ConversionState::Idle;
    ReconstructError error = ReconstructError::None;
    std::string message;
    BinaryArtifact artifact;
    std::vector<ArchiveEntry> entries;
    std::string outputName;
};

ConversionOutcome convertText(const std::string& text,
                              std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

std::string outputFileName(std::chrono::system_clock::time_point now);
std::string displayFileName(const std::string& inputName);
bool saveArtifact(const BinaryArtifact& artifact, const fs::path& path);
std::string stateName(ConversionState state);
