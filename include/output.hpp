#pragma once

#include "jansen.hpp"
#include "problem.hpp"

#include <Eigen/Dense>

#include <ostream>
#include <string>
#include <vector>

// Sample design plus the metadata needed to analyze its outputs later
struct SampleOutput {
    std::string method;    // "latin" or "radial"
    int sample_sets = 0;   // N passed to the sampler
    Eigen::MatrixXd samples;
};

// True when the path names an HDF5 file (.h5 / .hdf5)
bool isHDF5Path(const std::string& filename);

// Write sample matrix and problem definition to HDF5 file
void writeSamplesHDF5(const std::string& filename, const Problem& problem,
                      const SampleOutput& output);

// Write sample matrix as delimited text with a "# name1 name2 ..." header.
// Values are written in scientific notation with `precision` digits.
void writeSamplesText(const std::string& filename, const Problem& problem,
                      const Eigen::MatrixXd& samples, const std::string& delimiter = " ",
                      int precision = 8);

// Read the sample matrix back from a file written by writeSamplesHDF5
Eigen::MatrixXd readSamplesHDF5(const std::string& filename);

// Read model outputs: one value per line (text), or dataset /Y (HDF5)
Eigen::VectorXd readModelOutputs(const std::string& filename);

// Write model outputs as dataset /Y
void writeModelOutputsHDF5(const std::string& filename, const Eigen::VectorXd& Y);

struct AnalysisSettings {
    int sample_sets = 0;
    int num_resamples = 0;
    double conf_level = 0.0;
};

// Write sensitivity result to HDF5 file
void writeResultHDF5(const std::string& filename, const SensitivityResult& result,
                     const AnalysisSettings& settings);

// Print a name / ST / ST_conf table
void printResult(std::ostream& out, const SensitivityResult& result);
