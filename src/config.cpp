#include "config.hpp"
#include "logger.hpp"
#include <stdexcept>

void ArgParser::addOption(const std::string& name, bool takesValue, const std::string& canonical) {
    optionDefs[name] = {takesValue, canonical};
}

void ArgParser::parse(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Is this a known option?
        if (optionDefs.count(arg)) {
            const auto& info = optionDefs[arg];

            if (info.takesValue) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Missing value for option: " + arg);
                }
                parsedOptions[info.canonicalName] = argv[++i];
            } else {
                parsedOptions[info.canonicalName] = "true";
            }
        }
        else {
            // Not an option → positional argument
            positional.push_back(arg);
        }
    }
}

bool ArgParser::has(const std::string& canonical) const {
    return parsedOptions.count(canonical);
}

std::string ArgParser::get(const std::string& canonical, const std::string& def) const {
    auto it = parsedOptions.find(canonical);
    return it != parsedOptions.end() ? it->second : def;
}

Config parseArgs(int argc, const char* const argv[]) {

    Config config;
    ArgParser args;
    args.addOption("-h", false, "help");
    args.addOption("--help", false, "help");

    args.addOption("-e", false, "encode");
    args.addOption("--encode", false, "encode");

    args.addOption("-n", false, "noWrite");
    args.addOption("--no-write", false, "noWrite");

    args.addOption("-d", false, "debug");
    args.addOption("--debug", false, "debug");

    args.addOption("-v", false, "verbose");
    args.addOption("--verbose", false, "verbose");

    args.addOption("-o", true, "output");
    args.addOption("--output", true, "output");

    args.addOption("-C", true, "outputDir");
    args.addOption("--outputDir", true, "outputDir");

    args.addOption("-O", true, "jsonPath");
    args.addOption("--jsonPath", true, "jsonPath");

    args.addOption("-w", true, "width");
    args.addOption("--width", true, "width");

    args.parse(argc, argv);

    if(args.has("debug"))
    {
        Logger::info("Enabling Debug Mode");
        Logger::setLevel(LogLevel::DEBUG);
        config.debug = true;
    }

    if(args.has("encode"))
    {
        Logger::debug("Encoding mode");
        config.encode = true;
    }

    if(args.has("noWrite"))
    {
        Logger::debug("Listing only, archive will not be written");
        config.writeArchive = false;
    }

    if(args.has("verbose"))
    {
        Logger::debug("Enabling verbose Output");
        config.verbose = true;
    }

    if(args.has("width"))
    {
        std::string value = args.get("width");
        size_t consumed = 0;
        long width = -1;
        try {
            width = std::stol(value, &consumed);
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid line width: " + value);
        }
        if (consumed != value.size() || width < 0) {
            throw std::runtime_error("Invalid line width: " + value);
        }
        config.lineWidth = static_cast<size_t>(width);
        Logger::debug("Setting line width to " + std::to_string(config.lineWidth));
    }

    if(args.has("output"))
    {
        config.outputPath = args.get("output");
        Logger::debug("Setting output path to " + config.outputPath);
    }

    if(args.has("outputDir"))
    {
        config.outputDir = args.get("outputDir");
        Logger::debug("Setting output directory to " + config.outputDir);
    }

    if(args.has("jsonPath"))
    {
        config.jsonFile = args.get("jsonPath");
        config.jsonOutput = true;
        Logger::debug("Setting json output path to " + config.jsonFile);
    }

    if(args.has("help") || args.positional.empty())
    {
        config.showHelp = true;
        return config;
    }

    config.inputFile = args.positional.back();

    return config;
}

std::string usage() {
    return "Usage: zipunveil [-n] [-v] [-o file] [-C dir] [-O file] <input_file>\n"
           "       zipunveil -e [-w N] [-o file] <archive>\n"
           "  -o [file]  Write the reconstructed archive (or encoded text) to file\n"
           "  -C [path]  Directory for the default <timestamp>.zip name\n"
           "  -n         List entries only, do not write the archive\n"
           "  -O [file]  Write a JSON report to file\n"
           "  -e         Encode: turn an archive into a reversed-line base64 dump\n"
           "  -w N       Line width used by -e (default 76, 0 = single line)\n"
           "  -v         Verbose listing (method, sizes, CRC, date)\n"
           "  -d         Enable Debug mode\n"
           "  -h         Show this help message\n";
}
