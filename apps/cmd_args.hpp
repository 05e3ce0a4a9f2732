#pragma once

#include "config.hpp"
#include "parse_utils.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace cliarg {

inline bool isHelpFlag(const std::string& arg) {
    return arg == "-h" || arg == "--help";
}

inline std::string requireOptionValue(int argc, char* argv[], int& i, const char* flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error(std::string("Missing value for ") + flag);
    }
    return std::string(argv[++i]);
}

inline double parseDouble(const std::string& raw, const char* flag) {
    return parseutil::parseDoubleStrict(raw, flag);
}

inline int parseInt(const std::string& raw, const char* flag) {
    return parseutil::parseIntStrict(raw, flag);
}

inline uint64_t parseSeed(const std::string& raw, const char* flag) {
    return parseutil::parseSeedStrict(raw, flag);
}

// Options shared by every command: -c <config> plus flags that override
// global config keys. Command-specific flags are left to the caller.
struct CommonOptions {
    std::string config_file;
    std::map<std::string, std::string> overrides;
};

// Load the config file and apply command-line overrides on top
inline Config loadWithOverrides(const CommonOptions& opts) {
    if (opts.config_file.empty()) {
        throw std::runtime_error("Missing required option -c <config>");
    }
    Config cfg = Config::load(opts.config_file);
    for (const auto& kv : opts.overrides) {
        cfg.set(kv.first, kv.second);
    }
    return cfg;
}

// Consume argv[i] if it is a common option. Returns false if not recognized.
inline bool parseCommonOption(int argc, char* argv[], int& i, CommonOptions& opts) {
    const std::string arg = argv[i];
    if (arg == "-c") {
        opts.config_file = requireOptionValue(argc, argv, i, "-c");
    } else if (arg == "-o") {
        opts.overrides["output"] = requireOptionValue(argc, argv, i, "-o");
    } else if (arg == "--seed") {
        const std::string value = requireOptionValue(argc, argv, i, "--seed");
        (void)parseSeed(value, "--seed");
        opts.overrides["seed"] = value;
    } else {
        return false;
    }
    return true;
}

}  // namespace cliarg
