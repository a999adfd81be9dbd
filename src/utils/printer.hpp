#pragma once
#include "conversion.hpp"
#include <string>

struct ReportInfo {
    std::string inputFile;
    std::string outputPath;   // empty when nothing was written
};

void printListing(const ConversionOutcome& outcome, const std::string& displayName, bool verbose = false);
std::string buildJsonReport(const ConversionOutcome& outcome, const ReportInfo& info);
bool dumpJson(const ConversionOutcome& outcome, const ReportInfo& info, const std::string& filename);
