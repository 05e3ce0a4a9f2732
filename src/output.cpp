#include "output.hpp"
#include "parse_utils.hpp"

#include <highfive/H5Easy.hpp>
#include <highfive/H5File.hpp>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace {

// Convert a matrix to nested rows for HDF5 writing
std::vector<std::vector<double>> toRows(const Eigen::MatrixXd& mat) {
    std::vector<std::vector<double>> rows(static_cast<size_t>(mat.rows()),
                                          std::vector<double>(static_cast<size_t>(mat.cols())));
    for (Eigen::Index i = 0; i < mat.rows(); ++i) {
        for (Eigen::Index j = 0; j < mat.cols(); ++j) {
            rows[static_cast<size_t>(i)][static_cast<size_t>(j)] = mat(i, j);
        }
    }
    return rows;
}

Eigen::MatrixXd fromRows(const std::vector<std::vector<double>>& rows) {
    const size_t ncols = rows.empty() ? 0 : rows.front().size();
    Eigen::MatrixXd mat(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(ncols));
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].size() != ncols) {
            throw std::runtime_error("Ragged sample matrix in HDF5 file");
        }
        for (size_t j = 0; j < ncols; ++j) {
            mat(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = rows[i][j];
        }
    }
    return mat;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Eigen::VectorXd readModelOutputsText(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open model output file: " + filename);
    }

    std::vector<double> values;
    std::string line;
    int line_num = 0;
    while (std::getline(file, line)) {
        line_num++;
        std::string trimmed = parseutil::trimCopy(parseutil::stripComment(line));
        if (trimmed.empty()) {
            continue;
        }
        values.push_back(parseutil::parseDoubleStrict(
            trimmed, "model output at line " + std::to_string(line_num)));
    }

    if (values.empty()) {
        throw std::runtime_error("No model outputs found in " + filename);
    }
    return Eigen::Map<Eigen::VectorXd>(values.data(), static_cast<Eigen::Index>(values.size()));
}

}  // namespace

bool isHDF5Path(const std::string& filename) {
    return endsWith(filename, ".h5") || endsWith(filename, ".hdf5");
}

void writeSamplesHDF5(const std::string& filename, const Problem& problem,
                      const SampleOutput& output) {
    if (static_cast<int>(output.samples.cols()) != problem.num_vars) {
        throw std::runtime_error("writeSamplesHDF5: sample columns do not match num_vars");
    }

    HighFive::File file(filename, HighFive::File::Overwrite);

    file.createGroup("/parameters");
    H5Easy::dump(file, "/parameters/num_vars", problem.num_vars);
    H5Easy::dump(file, "/parameters/names", problem.names);
    H5Easy::dump(file, "/parameters/method", output.method);
    H5Easy::dump(file, "/parameters/sample_sets", output.sample_sets);

    std::vector<double> low_vals, high_vals;
    for (const auto& b : problem.bounds) {
        low_vals.push_back(b.low);
        high_vals.push_back(b.high);
    }
    H5Easy::dump(file, "/parameters/bounds_low", low_vals);
    H5Easy::dump(file, "/parameters/bounds_high", high_vals);

    if (problem.hasDists()) {
        std::vector<std::string> dist_names;
        for (auto d : problem.dists) {
            dist_names.push_back(toString(d));
        }
        H5Easy::dump(file, "/parameters/dists", dist_names);
    }

    H5Easy::dump(file, "/samples", toRows(output.samples));
}

void writeSamplesText(const std::string& filename, const Problem& problem,
                      const Eigen::MatrixXd& samples, const std::string& delimiter,
                      int precision) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file: " + filename);
    }

    // Header
    out << "# ";
    for (size_t i = 0; i < problem.names.size(); ++i) {
        out << problem.names[i];
        if (i + 1 < problem.names.size()) out << delimiter;
    }
    out << "\n";

    // Data
    out << std::scientific << std::setprecision(precision);
    for (Eigen::Index i = 0; i < samples.rows(); ++i) {
        for (Eigen::Index j = 0; j < samples.cols(); ++j) {
            out << samples(i, j);
            if (j + 1 < samples.cols()) out << delimiter;
        }
        out << "\n";
    }

    if (!out) {
        throw std::runtime_error("Failed writing samples to " + filename);
    }
}

Eigen::MatrixXd readSamplesHDF5(const std::string& filename) {
    HighFive::File file(filename, HighFive::File::ReadOnly);
    return fromRows(H5Easy::load<std::vector<std::vector<double>>>(file, "/samples"));
}

Eigen::VectorXd readModelOutputs(const std::string& filename) {
    if (!isHDF5Path(filename)) {
        return readModelOutputsText(filename);
    }

    HighFive::File file(filename, HighFive::File::ReadOnly);
    std::vector<double> values = H5Easy::load<std::vector<double>>(file, "/Y");
    if (values.empty()) {
        throw std::runtime_error("Dataset /Y in " + filename + " is empty");
    }
    return Eigen::Map<Eigen::VectorXd>(values.data(), static_cast<Eigen::Index>(values.size()));
}

void writeModelOutputsHDF5(const std::string& filename, const Eigen::VectorXd& Y) {
    HighFive::File file(filename, HighFive::File::Overwrite);
    std::vector<double> values(Y.data(), Y.data() + Y.size());
    H5Easy::dump(file, "/Y", values);
}

void writeResultHDF5(const std::string& filename, const SensitivityResult& result,
                     const AnalysisSettings& settings) {
    HighFive::File file(filename, HighFive::File::Overwrite);

    H5Easy::dump(file, "/names", result.names);
    H5Easy::dump(file, "/ST", result.ST);
    H5Easy::dump(file, "/ST_conf", result.ST_conf);

    file.createGroup("/parameters");
    H5Easy::dump(file, "/parameters/sample_sets", settings.sample_sets);
    H5Easy::dump(file, "/parameters/num_resamples", settings.num_resamples);
    H5Easy::dump(file, "/parameters/conf_level", settings.conf_level);
}

void printResult(std::ostream& out, const SensitivityResult& result) {
    const std::ios::fmtflags flags = out.flags();
    const std::streamsize precision = out.precision();

    size_t width = 4;
    for (const auto& name : result.names) {
        width = std::max(width, name.size());
    }

    out << std::left << std::setw(static_cast<int>(width)) << "Name"
        << std::right << std::setw(14) << "ST" << std::setw(14) << "ST_conf" << "\n";
    out << std::fixed << std::setprecision(6);
    for (size_t i = 0; i < result.names.size(); ++i) {
        out << std::left << std::setw(static_cast<int>(width)) << result.names[i]
            << std::right << std::setw(14) << result.ST[i]
            << std::setw(14) << result.ST_conf[i] << "\n";
    }
    out.flags(flags);
    out.precision(precision);
}
