#pragma once

#include <cctype>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace parseutil {

inline std::string trimCopy(std::string_view s) {
    size_t start = 0;
    while (start < s.size() &&
           std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    size_t end = s.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return std::string(s.substr(start, end - start));
}

// Strip a trailing '#' comment
inline std::string stripComment(const std::string& s) {
    size_t hash = s.find('#');
    if (hash == std::string::npos) {
        return s;
    }
    return s.substr(0, hash);
}

// Run a std::sto* style conversion and reject trailing characters
template <typename T, typename Convert>
T parseWholeToken(const std::string& raw_value, const std::string& context,
                  const char* expected, Convert convert) {
    const std::string value = trimCopy(raw_value);
    if (value.empty()) {
        throw std::runtime_error("Invalid value for " + context +
                                 ": expected " + expected + ", got empty");
    }

    try {
        size_t idx = 0;
        const T parsed = convert(value, &idx);
        if (idx != value.size()) {
            throw std::runtime_error("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + context +
                                 ": expected " + expected + ", got '" + raw_value + "'");
    }
}

inline double parseDoubleStrict(const std::string& raw_value, const std::string& context) {
    return parseWholeToken<double>(raw_value, context, "number",
        [](const std::string& v, size_t* idx) { return std::stod(v, idx); });
}

inline int parseIntStrict(const std::string& raw_value, const std::string& context) {
    return parseWholeToken<int>(raw_value, context, "integer",
        [](const std::string& v, size_t* idx) { return std::stoi(v, idx); });
}

// Seeds are unsigned 64-bit; a leading '-' is rejected rather than wrapped
inline uint64_t parseSeedStrict(const std::string& raw_value, const std::string& context) {
    if (trimCopy(raw_value).rfind('-', 0) == 0) {
        throw std::runtime_error("Invalid value for " + context +
                                 ": expected non-negative integer, got '" + raw_value + "'");
    }
    return parseWholeToken<uint64_t>(raw_value, context, "non-negative integer",
        [](const std::string& v, size_t* idx) {
            return static_cast<uint64_t>(std::stoull(v, idx));
        });
}

// Parse "[a, b, c]" or "a, b, c"
inline std::vector<double> parseDoubleListStrict(const std::string& raw_value,
                                                 const std::string& context) {
    std::string value = trimCopy(raw_value);
    if (value.size() >= 2 && value.front() == '[' && value.back() == ']') {
        value = trimCopy(std::string_view(value).substr(1, value.size() - 2));
    }

    if (value.empty()) {
        throw std::runtime_error("Invalid value for " + context +
                                 ": expected comma-separated numbers, got empty");
    }

    std::vector<double> values;
    std::stringstream ss(value);
    std::string token;
    int token_index = 0;
    while (std::getline(ss, token, ',')) {
        token = trimCopy(token);
        if (token.empty()) {
            throw std::runtime_error("Invalid value for " + context +
                                     ": empty token at position " +
                                     std::to_string(token_index));
        }
        values.push_back(parseDoubleStrict(token, context));
        ++token_index;
    }

    if (values.empty()) {
        throw std::runtime_error("Invalid value for " + context + ": no values parsed");
    }
    return values;
}

}  // namespace parseutil
