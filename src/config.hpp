#pragma once
#include <string>
#include <unordered_map>
#include <vector>

struct Config {
    bool encode = false;
    bool writeArchive = true;
    bool jsonOutput = false;
    bool verbose = false;
    bool debug = false;
    bool showHelp = false;
    size_t lineWidth = 76;
    std::string jsonFile;
    std::string outputPath;          // explicit -o target, empty for the timestamp name
    std::string outputDir = ".";
    std::string inputFile;
};

class ArgParser {
public:
    struct OptionInfo {
        bool takesValue;
        std::string canonicalName;
    };

    std::unordered_map<std::string, OptionInfo> optionDefs;
    std::unordered_map<std::string, std::string> parsedOptions;
    std::vector<std::string> positional;

    void addOption(const std::string& name, bool takesValue, const std::string& canonical);
    void parse(int argc, const char* const argv[]);
    bool has(const std::string& canonical) const;
    std::string get(const std::string& canonical, const std::string& def = "") const;
};

// Throws std::runtime_error on a missing option value or a bad --width.
Config parseArgs(int argc, const char* const argv[]);
std::string usage();
