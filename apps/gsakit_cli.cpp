#include "cmd_analyze.hpp"
#include "cmd_sample.hpp"

#include <iostream>
#include <string>

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [options]\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  latin              Latin hypercube sample (-c <config>)\n";
    std::cerr << "  radial             Radial one-at-a-time sample (-c <config>)\n";
    std::cerr << "  jansen             Total-effect indices from radial outputs (-c <config> -Y <file>)\n";
    std::cerr << "\n";
    std::cerr << "Run '" << prog << " <command> --help' for command options.\n";
    std::cerr << "\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << prog << " radial -c configs/ishigami.cfg -n 64 --seed 1 -o X.txt\n";
    std::cerr << "  " << prog << " jansen -c configs/ishigami.cfg -Y Y.txt -n 64 -o result.h5\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        printUsage(argv[0]);
        return 0;
    }

    try {
        if (command == "latin" || command == "radial") {
            return runSample(argc, argv, command);
        } else if (command == "jansen") {
            return runAnalyze(argc, argv);
        } else {
            std::cerr << "Unknown command: " << command << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
