#include "cmd_analyze.hpp"
#include "cmd_args.hpp"
#include "jansen.hpp"
#include "output.hpp"
#include "problem.hpp"
#include "random_state.hpp"

#include <iostream>
#include <string>

namespace {

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " jansen -c <config> [options]\n";
    std::cerr << "\n";
    std::cerr << "Compute Jansen total-effect indices from the outputs of a radial design.\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -c FILE          Problem config with [[param]] sections (required)\n";
    std::cerr << "  -Y FILE          Model outputs, one per line or /Y in .h5 (config: model_output)\n";
    std::cerr << "  -n N             Sample sets used for the design (config: sample_sets, samples)\n";
    std::cerr << "  --resamples R    Bootstrap resamples (default: 1000)\n";
    std::cerr << "  --conf LEVEL     Confidence level in (0,1) (default: 0.95)\n";
    std::cerr << "  --seed S         Random seed for the bootstrap (config: seed)\n";
    std::cerr << "  -o FILE          Write result to HDF5 file (config: result)\n";
    std::cerr << "\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << prog << " jansen -c configs/ishigami.cfg -Y Y.txt -n 64\n";
}

}  // namespace

int runAnalyze(int argc, char* argv[]) {
    cliarg::CommonOptions opts;

    try {
        for (int i = 2; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "-o") {
                opts.overrides["result"] = cliarg::requireOptionValue(argc, argv, i, "-o");
            } else if (cliarg::parseCommonOption(argc, argv, i, opts)) {
                continue;
            } else if (arg == "-Y") {
                opts.overrides["model_output"] = cliarg::requireOptionValue(argc, argv, i, "-Y");
            } else if (arg == "-n") {
                const std::string value = cliarg::requireOptionValue(argc, argv, i, "-n");
                (void)cliarg::parseInt(value, "-n");
                opts.overrides["sample_sets"] = value;
            } else if (arg == "--resamples") {
                const std::string value = cliarg::requireOptionValue(argc, argv, i, "--resamples");
                (void)cliarg::parseInt(value, "--resamples");
                opts.overrides["num_resamples"] = value;
            } else if (arg == "--conf") {
                const std::string value = cliarg::requireOptionValue(argc, argv, i, "--conf");
                (void)cliarg::parseDouble(value, "--conf");
                opts.overrides["conf_level"] = value;
            } else if (cliarg::isHelpFlag(arg)) {
                printUsage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    Config cfg = cliarg::loadWithOverrides(opts);
    Problem problem = Problem::fromConfig(cfg);

    AnalysisSettings settings;
    settings.sample_sets = cfg.has("sample_sets") ? cfg.getInt("sample_sets") : cfg.getInt("samples");
    settings.num_resamples = cfg.getInt("num_resamples", 1000);
    settings.conf_level = cfg.getDouble("conf_level", 0.95);

    const std::string model_output = cfg.getString("model_output");
    Eigen::VectorXd Y = readModelOutputs(model_output);
    std::cout << "Read " << Y.size() << " model outputs from " << model_output << std::endl;

    RandomState& rng = RandomState::global();
    if (cfg.has("seed")) {
        rng.seed(cfg.getSeed("seed"));
    }

    SensitivityResult result = jansenAnalyze(problem, Y, settings.sample_sets, rng,
                                             settings.num_resamples, settings.conf_level);

    std::cout << "\n";
    printResult(std::cout, result);

    if (cfg.has("result")) {
        const std::string result_file = cfg.getString("result");
        writeResultHDF5(result_file, result, settings);
        std::cout << "\nOutput written to " << result_file << std::endl;
    }

    return 0;
}
