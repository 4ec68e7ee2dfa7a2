// =============================================================================
// src/cfm/app/CFMApp.cpp
// =============================================================================
#include "cfm/app/CFMApp.hpp"
#include "cfm/core/CFMErrors.hpp"
#include "functions/io/DataIO.hpp"
#include "pipeline/DataSplit.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {

std::vector<double> scaled(const std::vector<double>& values, double factor) {
    std::vector<double> out(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        out[i] = values[i] * factor;
    }
    return out;
}

}  // namespace

bool parsePoleMode(const std::string& mode) {
    if (mode == "propagate") return false;
    if (mode == "throw") return true;
    throw std::invalid_argument("Unsupported pole mode: " + mode + " (expected propagate|throw)");
}

CFMConfig makeCFMConfig(const CFMOptions& opts) {
    CFMConfig config;
    config.depth = opts.depth;
    config.normalizationFactor = opts.normalizationFactor;
    config.poleHandling = opts.failOnPole ? PoleHandling::Throw : PoleHandling::Propagate;
    config.verbose = opts.verbose;

    if (opts.subModel == "ols") {
        config.subModelType = SubModelType::OrdinaryLeastSquares;
    } else if (opts.subModel == "lasso" || opts.subModel.find("lasso:") == 0) {
        config.subModelType = SubModelType::L1Regularized;
        auto pos = opts.subModel.find(':');
        if (pos != std::string::npos) {
            config.l1Alpha = std::stod(opts.subModel.substr(pos + 1));
        }
    } else {
        throw std::invalid_argument("Unsupported sub-model: " + opts.subModel);
    }

    config.validate();
    return config;
}

std::unique_ptr<GBRTTrainer> createBaselineTrainer(const CFMOptions& opts) {
    GBRTConfig config;
    config.numIterations = opts.baselineIterations;
    config.learningRate = opts.baselineLearningRate;
    config.maxDepth = opts.baselineMaxDepth;
    config.verbose = opts.verbose;
    return std::make_unique<GBRTTrainer>(config);
}

void runCFMApp(const CFMOptions& opts) {
    auto totalStart = std::chrono::high_resolution_clock::now();

    // 读取数据
    int numFeatures = 0;
    DataIO io(opts.verbose);
    auto [X, y] = io.readTabular(opts.dataPath, numFeatures);
    if (y.empty()) {
        throw std::runtime_error("No data loaded from " + opts.dataPath);
    }
    if (!io.validateData(X, y, numFeatures)) {
        throw std::runtime_error("Invalid dataset: " + opts.dataPath);
    }

    // 划分数据集
    DataParams dp;
    if (!splitDataset(X, y, numFeatures, dp, opts.testRatio, opts.shuffle, opts.seed)) {
        throw std::runtime_error("Failed to split dataset");
    }
    if (opts.verbose) {
        std::cout << "Train: " << dp.y_train.size() << " samples | Test: "
                  << dp.y_test.size() << " samples" << std::endl;
    }

    // 训练 CFM
    const CFMConfig config = makeCFMConfig(opts);
    ContinuedFractionModel model(config);

    if (opts.verbose) {
        std::cout << "\n=== Training CFM ===" << std::endl;
    }
    auto trainStart = std::chrono::high_resolution_clock::now();
    model.fit(dp.X_train, dp.rowLength, dp.y_train);
    auto trainEnd = std::chrono::high_resolution_clock::now();

    // **逐层评估：模型输出为归一化尺度，误差乘回 factor^2**
    const double factor = config.normalizationFactor;
    const auto yTrainNorm = scaled(dp.y_train, 1.0 / factor);
    const auto yTestNorm = scaled(dp.y_test, 1.0 / factor);

    std::cout << "\n=== CFM Results ===" << std::endl;
    std::cout << "Sub-model: " << toString(config.subModelType)
              << " | Depth: " << model.getDepth()
              << " | Normalization: " << factor << std::endl;

    for (int k = 1; k <= model.getDepth(); ++k) {
        try {
            const double trainMSE = model.meanSquaredError(dp.X_train, dp.rowLength, yTrainNorm, k) * factor * factor;
            std::cout << "Depth " << k
                      << " | Train MSE: " << std::fixed << std::setprecision(6) << trainMSE;
            if (!dp.y_test.empty()) {
                const double testMSE = model.meanSquaredError(dp.X_test, dp.rowLength, yTestNorm, k) * factor * factor;
                std::cout << " | Test MSE: " << testMSE;
            }
            std::cout << " | Offset: " << model.getOffsets()[k] << std::endl;
        } catch (const PredictionPole& e) {
            std::cout << std::endl;
            std::cerr << "Depth " << k << ": " << e.what() << std::endl;
        }
    }

    // 基线对比
    if (opts.baselineIterations > 0) {
        auto baseline = createBaselineTrainer(opts);
        if (opts.verbose) {
            std::cout << "\n=== Training " << baseline->name() << " baseline ===" << std::endl;
        }
        auto baseStart = std::chrono::high_resolution_clock::now();
        baseline->fit(dp.X_train, dp.rowLength, dp.y_train);
        auto baseEnd = std::chrono::high_resolution_clock::now();

        double trainMSE = 0.0, trainMAE = 0.0;
        baseline->evaluate(dp.X_train, dp.rowLength, dp.y_train, trainMSE, trainMAE);

        std::cout << "\n=== Baseline Results ===" << std::endl;
        std::cout << "Algorithm: " << baseline->name()
                  << " | Trees: " << baseline->getModel()->getTreeCount() << std::endl;
        std::cout << "Train MSE: " << std::fixed << std::setprecision(6) << trainMSE
                  << " | Train MAE: " << trainMAE;
        if (!dp.y_test.empty()) {
            double testMSE = 0.0, testMAE = 0.0;
            baseline->evaluate(dp.X_test, dp.rowLength, dp.y_test, testMSE, testMAE);
            std::cout << " | Test MSE: " << testMSE << " | Test MAE: " << testMAE;
        }
        std::cout << std::endl;
        std::cout << "Baseline Time: "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(baseEnd - baseStart).count()
                  << "ms" << std::endl;
    }

    // 输出测试集预测（原始尺度）
    if (!opts.outputPath.empty() && !dp.y_test.empty()) {
        const auto predictions = scaled(model.predictBatch(dp.X_test, dp.rowLength), factor);
        io.writeResults(predictions, opts.outputPath);
        std::cout << "Wrote " << predictions.size() << " predictions to " << opts.outputPath << std::endl;
    }

    auto totalEnd = std::chrono::high_resolution_clock::now();
    auto trainTime = std::chrono::duration_cast<std::chrono::milliseconds>(trainEnd - trainStart);
    auto totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(totalEnd - totalStart);
    std::cout << "CFM Train Time: " << trainTime.count() << "ms" << std::endl;
    std::cout << "Total Time: " << totalTime.count() << "ms" << std::endl;
}

CFMOptions parseCFMCommandLine(int argc, char** argv) {
    CFMOptions opts;
    opts.dataPath = "../data/supercon.txt";

    if (argc >= 2) opts.dataPath = argv[1];
    if (argc >= 3) opts.depth = std::stoi(argv[2]);
    if (argc >= 4) opts.normalizationFactor = std::stod(argv[3]);
    if (argc >= 5) opts.subModel = argv[4];
    if (argc >= 6) opts.testRatio = std::stod(argv[5]);
    if (argc >= 7) opts.baselineIterations = std::stoi(argv[6]);
    if (argc >= 8 && std::string(argv[7]) != "-") opts.outputPath = argv[7];
    if (argc >= 9) opts.failOnPole = parsePoleMode(argv[8]);
    if (argc >= 10) opts.shuffle = std::stoi(argv[9]) != 0;
    if (argc >= 11) opts.seed = static_cast<uint32_t>(std::stoul(argv[10]));

    return opts;
}
