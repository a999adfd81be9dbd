#include "config.hpp"
#include "conversion.hpp"
#include "reconstructor.hpp"
#include "utils/file_reader.hpp"
#include "utils/printer.hpp"
#include "logger.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace {

int runEncode(const Config& config) {
    std::vector<uint8_t> archive = readFile(config.inputFile);
    Logger::info("Encoding " + std::to_string(archive.size()) + " bytes");
    if (archive.empty()) {
        Logger::error("Input file is empty, nothing to encode");
        return 1;
    }

    std::string text = obfuscate(archive, config.lineWidth);
    if (config.outputPath.empty()) {
        std::cout << text;
        return 0;
    }
    if (!writeTextFile(config.outputPath, text))
        return 2;
    Logger::info("Wrote " + config.outputPath);
    return 0;
}

int runDecode(const Config& config) {
    std::string text = readTextFile(config.inputFile);
    std::string displayName = displayFileName(fs::path(config.inputFile).filename().string());
    Logger::info("Processing " + displayName + "...");

    ConversionOutcome outcome = convertText(text);
    printListing(outcome, displayName, config.verbose);

    ReportInfo report;
    report.inputFile = config.inputFile;

    int rc = 0;
    if (outcome.state == ConversionState::Success) {
        if (config.writeArchive) {
            fs::path target = config.outputPath.empty()
                ? fs::path(config.outputDir) / outcome.outputName
                : fs::path(config.outputPath);
            if (saveArtifact(outcome.artifact, target)) {
                report.outputPath = target.string();
                Logger::info("Saved " + target.string());
            } else {
                rc = 2;
            }
        }
    } else {
        Logger::error(outcome.message);
        rc = 1;
    }

    if (config.jsonOutput && !dumpJson(outcome, report, config.jsonFile))
        rc = 2;

    return rc;
}

} // namespace

int main(int argc, char* argv[]) {
    Logger::setLevel(LogLevel::INFO);
    Logger::info("ZipUnveil v0.1");

    Config config;
    try {
        config = parseArgs(argc, argv);
    } catch (const std::runtime_error& e) {
        Logger::error(e.what());
        std::cout << usage();
        return 2;
    }

    if (config.showHelp) {
        std::cout << usage();
        return 0;
    }

    auto start = std::chrono::high_resolution_clock::now();
    int rc;
    try {
        rc = config.encode ? runEncode(config) : runDecode(config);
    } catch (const std::runtime_error& e) {
        Logger::error(e.what());
        return 2;
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    Logger::debug("Total elapsed time: " + std::to_string(elapsed) + "ms");

    return rc;
}
