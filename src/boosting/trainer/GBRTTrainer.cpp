// =============================================================================
// src/boosting/trainer/GBRTTrainer.cpp - OpenMP并行版本
// =============================================================================
#include "boosting/trainer/GBRTTrainer.hpp"
#include "tree/trainer/SingleTreeTrainer.hpp"
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#ifdef _OPENMP
#include <omp.h>
#endif

GBRTTrainer::GBRTTrainer(const GBRTConfig& config)
    : config_(config) {
    if (config_.numIterations < 1) {
        throw std::invalid_argument("GBRT: numIterations must be >= 1");
    }
    if (!(config_.learningRate > 0.0)) {
        throw std::invalid_argument("GBRT: learningRate must be > 0");
    }
    if (config_.maxDepth < 1) {
        throw std::invalid_argument("GBRT: maxDepth must be >= 1");
    }
    if (config_.minSamplesLeaf < 1) {
        throw std::invalid_argument("GBRT: minSamplesLeaf must be >= 1");
    }

    #ifdef _OPENMP
    if (config_.verbose) {
        std::cout << "GBRT initialized with OpenMP support ("
                  << omp_get_max_threads() << " threads)" << std::endl;
    }
    #endif
}

void GBRTTrainer::fit(const std::vector<double>& X,
                      int rowLength,
                      const std::vector<double>& y) {
    if (rowLength < 1 || y.empty() || X.size() != y.size() * static_cast<size_t>(rowLength)) {
        throw std::invalid_argument("GBRT: X must have y.size() rows of rowLength features");
    }

    auto totalStart = std::chrono::high_resolution_clock::now();
    fitted_ = false;
    model_.clear();
    trainingLoss_.clear();
    trainingLoss_.reserve(config_.numIterations);

    const size_t n = y.size();

    // **基准分数 = 标签均值**
    double sum = 0.0;
    #pragma omp parallel for reduction(+:sum) schedule(static, 2048) if(n > 1000)
    for (size_t i = 0; i < n; ++i) {
        sum += y[i];
    }
    const double baseScore = sum / static_cast<double>(n);
    model_.setBaseScore(baseScore);

    std::vector<double> currentPred(n, baseScore);
    std::vector<double> residuals(n);

    if (config_.verbose) {
        std::cout << "Training GBRT with " << config_.numIterations
                  << " iterations..." << std::endl;
    }

    for (int iter = 0; iter < config_.numIterations; ++iter) {
        auto iterStart = std::chrono::high_resolution_clock::now();

        // **步骤1: 损失与残差（平方损失的负梯度）**
        double loss = 0.0;
        #pragma omp parallel for reduction(+:loss) schedule(static, 4096) if(n > 2000)
        for (size_t i = 0; i < n; ++i) {
            const double r = y[i] - currentPred[i];
            residuals[i] = r;
            loss += 0.5 * r * r;
        }
        loss /= static_cast<double>(n);
        trainingLoss_.push_back(loss);

        // **步骤2: 拟合残差树**
        SingleTreeTrainer treeTrainer(config_.maxDepth, config_.minSamplesLeaf);
        treeTrainer.train(X, rowLength, residuals);

        // **步骤3: 更新预测**
        const double lr = config_.learningRate;
        #pragma omp parallel for schedule(static, 1024) if(n > 500)
        for (size_t i = 0; i < n; ++i) {
            currentPred[i] += lr * treeTrainer.predict(&X[i * rowLength]);
        }

        model_.addTree(treeTrainer.releaseRoot(), lr);

        if (config_.verbose && iter % 10 == 0) {
            auto iterEnd = std::chrono::high_resolution_clock::now();
            auto iterTime = std::chrono::duration_cast<std::chrono::milliseconds>(iterEnd - iterStart);
            std::cout << "Iter " << iter
                      << " | Loss: " << std::fixed << std::setprecision(6) << loss
                      << " | Time: " << iterTime.count() << "ms" << std::endl;
        }
    }

    numFeatures_ = rowLength;
    fitted_ = true;

    if (config_.verbose) {
        auto totalEnd = std::chrono::high_resolution_clock::now();
        auto totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(totalEnd - totalStart);
        std::cout << "GBRT training completed in " << totalTime.count()
                  << "ms with " << model_.getTreeCount() << " trees" << std::endl;
    }
}

double GBRTTrainer::predict(const double* sample, int rowLength) const {
    checkFitted(rowLength);
    return model_.predict(sample);
}

std::vector<double> GBRTTrainer::predictBatch(const std::vector<double>& X,
                                              int rowLength) const {
    checkFitted(rowLength);
    if (X.size() % static_cast<size_t>(rowLength) != 0) {
        throw std::invalid_argument("GBRT: X size is not a multiple of rowLength");
    }
    return model_.predictBatch(X, rowLength);
}

void GBRTTrainer::evaluate(const std::vector<double>& X,
                           int rowLength,
                           const std::vector<double>& y,
                           double& mse,
                           double& mae) const {
    const auto predictions = predictBatch(X, rowLength);
    if (predictions.size() != y.size() || y.empty()) {
        throw std::invalid_argument("GBRT: prediction/target size mismatch");
    }

    const size_t n = y.size();
    mse = 0.0;
    mae = 0.0;

    #pragma omp parallel for reduction(+:mse,mae) schedule(static, 2048) if(n > 2000)
    for (size_t i = 0; i < n; ++i) {
        const double diff = y[i] - predictions[i];
        mse += diff * diff;
        mae += std::abs(diff);
    }

    mse /= static_cast<double>(n);
    mae /= static_cast<double>(n);
}

void GBRTTrainer::checkFitted(int rowLength) const {
    if (!fitted_) {
        throw std::logic_error("GBRT model has not been fitted");
    }
    if (rowLength != numFeatures_) {
        throw std::invalid_argument("GBRT: rowLength does not match the training data");
    }
}
