#include <iostream>
#include "printer.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include "file_reader.hpp"
#include "cJSON.h"
#include <iomanip>
#include <sstream>
#include <string>
#include <cstdlib>
#include <vector>

namespace {

cJSON* build_json_entry(const ArchiveEntry& e) {
    cJSON* item = cJSON_CreateObject();
    cJSON_AddStringToObject(item, "name", e.name.c_str());
    cJSON_AddStringToObject(item, "method", compressionMethodName(e.method).c_str());
    cJSON_AddNumberToObject(item, "compressedSize", static_cast<double>(e.compressedSize));
    cJSON_AddNumberToObject(item, "uncompressedSize", static_cast<double>(e.uncompressedSize));
    cJSON_AddStringToObject(item, "crc32", to_hex(e.crc32).c_str());
    cJSON_AddStringToObject(item, "modified", format_dos_datetime(e.modTime, e.modDate).c_str());
    cJSON_AddStringToObject(item, "offset", to_hex(e.headerOffset).c_str());
    return item;
}

void printEntry(const ArchiveEntry& e, bool last, bool verbose) {
    std::cout << (last ? "└── " : "├── ") << ansi::bold << e.name << ansi::reset << "\n";
    if (!verbose)
        return;

    std::string childPrefix = last ? "    " : "│   ";
    std::ostringstream oss;
    oss << ansi::yellow << compressionMethodName(e.method) << ansi::reset
        << " (" << ansi::green << e.compressedSize << ansi::reset
        << " -> " << ansi::green << e.uncompressedSize << ansi::reset << " bytes)"
        << ansi::gray << " crc=" << std::hex << std::setw(8) << std::setfill('0') << e.crc32
        << std::dec << " " << format_dos_datetime(e.modTime, e.modDate) << ansi::reset;
    std::cout << childPrefix << oss.str() << "\n";
}

} // namespace

void printListing(const ConversionOutcome& outcome, const std::string& displayName, bool verbose) {
    std::cout << "* " << displayName << std::endl;

    if (outcome.state != ConversionState::Success) {
        std::cout << ansi::red << "  " << outcome.message << ansi::reset << "\n";
        return;
    }

    std::cout << ansi::cyan << "  " << outcome.artifact.size() << " bytes" << ansi::reset
              << ", " << ansi::green << outcome.entries.size() << " entries" << ansi::reset << "\n";
    for (size_t i = 0; i < outcome.entries.size(); ++i) {
        printEntry(outcome.entries[i], i == outcome.entries.size() - 1, verbose);
    }
}

std::string buildJsonReport(const ConversionOutcome& outcome, const ReportInfo& info) {
    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, "input", info.inputFile.c_str());
    cJSON_AddStringToObject(root, "state", stateName(outcome.state).c_str());
    cJSON_AddStringToObject(root, "message", outcome.message.c_str());

    if (outcome.state == ConversionState::Success) {
        if (info.outputPath.empty())
            cJSON_AddNullToObject(root, "output");
        else
            cJSON_AddStringToObject(root, "output", info.outputPath.c_str());
        cJSON_AddNumberToObject(root, "size", static_cast<double>(outcome.artifact.size()));

        cJSON* entries = cJSON_CreateArray();
        for (const auto& e : outcome.entries) {
            cJSON_AddItemToArray(entries, build_json_entry(e));
        }
        cJSON_AddItemToObject(root, "entries", entries);
    }

    char* jsonStr = cJSON_Print(root);
    std::string json = jsonStr ? jsonStr : "";
    cJSON_Delete(root);
    free(jsonStr);
    return json;
}

bool dumpJson(const ConversionOutcome& outcome, const ReportInfo& info, const std::string& filename) {
    std::string json = buildJsonReport(outcome, info);
    if (json.empty()) {
        Logger::error("Failed to serialize JSON report");
        return false;
    }
    return writeTextFile(filename, json);
}
