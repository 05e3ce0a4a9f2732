#pragma once

#include "parse_utils.hpp"

#include <cstdint>
#include <istream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// One [[param]] section from a problem config file
struct ParamConfigEntry {
    std::string name;
    std::vector<double> bounds;
    std::string dist;  // empty when not given
    int line = 0;      // line of the [[param]] marker
};

// Simple key=value config file parser with [[param]] section support
class Config {
public:
    static Config load(const std::string& filename);

    // Parse config text directly (used by load and by tests)
    static Config parse(std::istream& in);

    bool hasParams() const {
        return !params_.empty();
    }

    const std::vector<ParamConfigEntry>& getParamEntries() const {
        return params_;
    }

    bool has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    std::string getString(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            throw std::runtime_error("Missing config key: " + key);
        }
        return it->second;
    }

    std::string getString(const std::string& key, const std::string& default_val) const {
        auto it = values_.find(key);
        return (it != values_.end()) ? it->second : default_val;
    }

    double getDouble(const std::string& key) const {
        return parseutil::parseDoubleStrict(getString(key), "'" + key + "'");
    }

    double getDouble(const std::string& key, double default_val) const {
        if (!has(key)) return default_val;
        return getDouble(key);
    }

    int getInt(const std::string& key) const {
        return parseutil::parseIntStrict(getString(key), "'" + key + "'");
    }

    int getInt(const std::string& key, int default_val) const {
        if (!has(key)) return default_val;
        return getInt(key);
    }

    uint64_t getSeed(const std::string& key) const {
        return parseutil::parseSeedStrict(getString(key), "'" + key + "'");
    }

    // Override or add a global value (CLI flags take precedence over the file)
    void set(const std::string& key, const std::string& value) {
        values_[key] = value;
    }

private:
    std::map<std::string, std::string> values_;
    std::vector<ParamConfigEntry> params_;
};
