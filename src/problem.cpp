#include "problem.hpp"

#include <set>
#include <stdexcept>

Distribution parseDistribution(const std::string& name) {
    if (name == "unif") return Distribution::Uniform;
    if (name == "triang") return Distribution::Triangular;
    if (name == "norm") return Distribution::Normal;
    if (name == "lognorm") return Distribution::LogNormal;
    throw std::runtime_error("Unknown distribution '" + name +
                             "': choose one of unif, triang, norm, lognorm");
}

std::string toString(Distribution dist) {
    switch (dist) {
        case Distribution::Uniform: return "unif";
        case Distribution::Triangular: return "triang";
        case Distribution::Normal: return "norm";
        case Distribution::LogNormal: return "lognorm";
    }
    return "unknown";
}

void Problem::validate() const {
    if (num_vars < 1) {
        throw std::runtime_error("Problem must define at least one parameter, got num_vars=" +
                                 std::to_string(num_vars));
    }
    const size_t D = static_cast<size_t>(num_vars);
    if (names.size() != D) {
        throw std::runtime_error("Problem: expected " + std::to_string(D) + " names, got " +
                                 std::to_string(names.size()));
    }
    if (bounds.size() != D) {
        throw std::runtime_error("Problem: expected " + std::to_string(D) + " bounds, got " +
                                 std::to_string(bounds.size()));
    }
    if (!dists.empty() && dists.size() != D) {
        throw std::runtime_error("Problem: expected " + std::to_string(D) + " dists, got " +
                                 std::to_string(dists.size()));
    }

    std::set<std::string> unique(names.begin(), names.end());
    if (unique.size() != names.size()) {
        throw std::runtime_error("Problem: parameter names must be unique");
    }
}

Problem Problem::fromConfig(const Config& cfg) {
    if (!cfg.hasParams()) {
        throw std::runtime_error("Config must define parameters using [[param]] sections");
    }

    const auto& entries = cfg.getParamEntries();
    size_t with_dist = 0;
    for (const auto& entry : entries) {
        if (!entry.dist.empty()) ++with_dist;
    }
    if (with_dist != 0 && with_dist != entries.size()) {
        throw std::runtime_error("Either all [[param]] sections set 'dist' or none do (" +
                                 std::to_string(with_dist) + " of " +
                                 std::to_string(entries.size()) + " set it)");
    }

    Problem problem;
    problem.num_vars = static_cast<int>(entries.size());
    for (const auto& entry : entries) {
        if (entry.bounds.size() != 2) {
            throw std::runtime_error("Parameter '" + entry.name + "' (line " +
                                     std::to_string(entry.line) +
                                     "): bounds must have exactly 2 values, got " +
                                     std::to_string(entry.bounds.size()));
        }
        problem.names.push_back(entry.name);
        problem.bounds.push_back({entry.bounds[0], entry.bounds[1]});
        if (with_dist != 0) {
            problem.dists.push_back(parseDistribution(entry.dist));
        }
    }

    problem.validate();
    return problem;
}
