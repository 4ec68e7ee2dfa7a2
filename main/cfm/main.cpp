// =============================================================================
// main/cfm/main.cpp
// =============================================================================
#include "cfm/app/CFMApp.hpp"
#include <iostream>

int main(int argc, char** argv) {
    try {
        CFMOptions opts = parseCFMCommandLine(argc, argv);

        if (opts.verbose) {
            std::cout << "=== CFM Configuration ===" << std::endl;
            std::cout << "Data: " << opts.dataPath << std::endl;
            std::cout << "Depth: " << opts.depth
                      << " | Normalization: " << opts.normalizationFactor << std::endl;
            std::cout << "Sub-model: " << opts.subModel
                      << " | Test ratio: " << opts.testRatio << std::endl;
            std::cout << "Pole mode: " << (opts.failOnPole ? "throw" : "propagate")
                      << " | Shuffle: " << (opts.shuffle ? "yes" : "no")
                      << " | Seed: " << opts.seed << std::endl;
            std::cout << "Baseline iterations: " << opts.baselineIterations << std::endl;
            std::cout << std::endl;
        }

        runCFMApp(opts);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
