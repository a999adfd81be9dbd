#include "conversion.hpp"
#include "file_reader.hpp"
#include "helpers.hpp"
#include "logger.hpp"

ConversionOutcome convertText(const std::string& text, std::chrono::system_clock::time_point now) {
    ConversionOutcome outcome;
    outcome.state = ConversionState::Processing;

    ReconstructResult result = reconstruct(text);
    if (!result.ok()) {
        outcome.state = ConversionState::Error;
        outcome.error = result.error;
        outcome.message = describeError(result.error);
        return outcome;
    }

    outcome.artifact = std::move(result.artifact);
    outcome.entries = scanDirectoryEntries(outcome.artifact.bytes());
    outcome.outputName = outputFileName(now);
    outcome.state = ConversionState::Success;
    Logger::debug("Reconstructed " + std::to_string(outcome.artifact.size()) + " bytes, " +
                  std::to_string(outcome.entries.size()) + " entries");
    return outcome;
}

std::string outputFileName(std::chrono::system_clock::time_point now) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    return std::to_string(ms) + ".zip";
}

std::string displayFileName(const std::string& inputName) {
    if (ends_with_ci(inputName, ".txt"))
        return inputName;
    return inputName + ".txt";
}

bool saveArtifact(const BinaryArtifact& artifact, const fs::path& path) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            Logger::error("Cannot create " + path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }
    return writeFile(path.string(), artifact.bytes());
}

std::string stateName(ConversionState state) {
    switch (state) {
    case ConversionState::Idle:       return "idle";
    case ConversionState::Processing: return "processing";
    case ConversionState::Success:    return "success";
    case ConversionState::Error:      return "error";
    }
    return "unknown";
}
