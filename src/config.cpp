#include "config.hpp"

#include <fstream>
#include <set>
#include <vector>

namespace {

struct ParamRequiredFields {
    bool name = false;
    bool bounds = false;
};

void validateParamSection(const ParamRequiredFields& fields, int section_start_line) {
    std::vector<std::string> missing;
    if (!fields.name) missing.push_back("name");
    if (!fields.bounds) missing.push_back("bounds");

    if (missing.empty()) {
        return;
    }

    std::string msg = "Missing required parameter field(s) in [[param]] section starting at line " +
                      std::to_string(section_start_line) + ": ";
    for (size_t i = 0; i < missing.size(); ++i) {
        msg += missing[i];
        if (i + 1 < missing.size()) {
            msg += ", ";
        }
    }
    throw std::runtime_error(msg);
}

std::vector<double> parseBoundsAtLine(const std::string& value, int line_num) {
    try {
        return parseutil::parseDoubleListStrict(value, "'bounds'");
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for 'bounds' at line " +
                                 std::to_string(line_num) + ": " + value);
    }
}

}  // namespace

Config Config::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filename);
    }
    return parse(file);
}

Config Config::parse(std::istream& in) {
    Config config;

    std::string line;
    int line_num = 0;
    bool in_param_section = false;
    ParamConfigEntry current_param;
    ParamRequiredFields param_fields;
    std::set<std::string> seen_names;
    auto finalizeParamSection = [&]() {
        validateParamSection(param_fields, current_param.line);
        if (!seen_names.insert(current_param.name).second) {
            throw std::runtime_error("Duplicate parameter name '" + current_param.name +
                                     "' in [[param]] section starting at line " +
                                     std::to_string(current_param.line));
        }
        config.params_.push_back(current_param);
    };

    while (std::getline(in, line)) {
        line_num++;

        // Strip inline comments, then skip empty lines
        std::string uncommented = parseutil::stripComment(line);
        std::string trimmed = parseutil::trimCopy(uncommented);
        if (trimmed.empty()) {
            continue;
        }

        if (trimmed == "[[param]]") {
            if (in_param_section) {
                finalizeParamSection();
            }
            in_param_section = true;
            current_param = ParamConfigEntry();
            current_param.line = line_num;
            param_fields = ParamRequiredFields();
            continue;
        }

        size_t eq = uncommented.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error("Invalid config line " + std::to_string(line_num) + ": " + line);
        }

        std::string key = parseutil::trimCopy(uncommented.substr(0, eq));
        std::string value = parseutil::trimCopy(uncommented.substr(eq + 1));

        if (key.empty()) {
            throw std::runtime_error("Empty key at line " + std::to_string(line_num));
        }

        if (in_param_section) {
            if (key == "name") {
                if (value.empty()) {
                    throw std::runtime_error("Empty parameter name at line " + std::to_string(line_num));
                }
                current_param.name = value;
                param_fields.name = true;
            } else if (key == "bounds") {
                current_param.bounds = parseBoundsAtLine(value, line_num);
                param_fields.bounds = true;
            } else if (key == "dist") {
                current_param.dist = value;
            } else {
                throw std::runtime_error("Unknown parameter field '" + key + "' at line " +
                                         std::to_string(line_num));
            }
        } else {
            config.values_[key] = value;
        }
    }

    if (in_param_section) {
        finalizeParamSection();
    }

    return config;
}
