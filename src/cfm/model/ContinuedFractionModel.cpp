// =============================================================================
// src/cfm/model/ContinuedFractionModel.cpp - OpenMP并行版本
// =============================================================================
#include "cfm/model/ContinuedFractionModel.hpp"
#include "cfm/core/CFMErrors.hpp"
#include "linear/ILinearSolver.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#ifdef _OPENMP
#include <omp.h>
#endif

ContinuedFractionModel::ContinuedFractionModel(const CFMConfig& config)
    : config_(config) {
    config_.validate();

    #ifdef _OPENMP
    if (config_.verbose) {
        std::cout << "CFM initialized with OpenMP support ("
                  << omp_get_max_threads() << " threads)" << std::endl;
    }
    #endif
}

ContinuedFractionModel ContinuedFractionModel::fromComponents(const CFMConfig& config,
                                                              std::vector<LinearModel> subModels,
                                                              std::vector<double> offsets) {
    if (subModels.empty()) {
        throw InvalidParameter("fromComponents: at least one sub-model is required");
    }
    const int numFeatures = subModels.front().getNumFeatures();
    if (numFeatures < 1) {
        throw InvalidParameter("fromComponents: sub-models must have at least one feature");
    }
    for (const auto& sub : subModels) {
        if (sub.getNumFeatures() != numFeatures) {
            throw InvalidParameter("fromComponents: sub-models disagree on feature count");
        }
    }
    if (offsets.size() != subModels.size() + 2) {
        throw InvalidParameter("fromComponents: expected " + std::to_string(subModels.size() + 2) +
                               " offsets, got " + std::to_string(offsets.size()));
    }
    if (offsets.front() != 0.0 || offsets.back() != 0.0) {
        throw InvalidParameter("fromComponents: padding offsets must be 0");
    }
    for (double off : offsets) {
        if (!std::isfinite(off) || off < 0.0) {
            throw InvalidParameter("fromComponents: offsets must be finite and >= 0");
        }
    }

    CFMConfig cfg = config;
    cfg.depth = static_cast<int>(subModels.size());

    ContinuedFractionModel model(cfg);
    model.subModels_ = std::move(subModels);
    model.offsets_ = std::move(offsets);
    model.trainingLoss_.clear();
    model.numFeatures_ = numFeatures;
    model.fitted_ = true;
    return model;
}

void ContinuedFractionModel::fit(const std::vector<double>& X,
                                 int rowLength,
                                 const std::vector<double>& y,
                                 int depth) {
    resetState();
    if (depth < 1) {
        throw InvalidParameter("depth must be >= 1, got " + std::to_string(depth));
    }
    config_.depth = depth;
    fit(X, rowLength, y);
}

// **核心：逐层残差倒数拟合**
void ContinuedFractionModel::fit(const std::vector<double>& X,
                                 int rowLength,
                                 const std::vector<double>& y) {
    // 失败时保持未训练状态
    resetState();

    if (rowLength < 1) {
        throw InvalidParameter("rowLength must be >= 1");
    }
    if (y.empty()) {
        throw InvalidParameter("training target is empty");
    }
    if (X.size() != y.size() * static_cast<size_t>(rowLength)) {
        throw InvalidParameter("X has " + std::to_string(X.size()) + " values, expected " +
                               std::to_string(y.size()) + " rows x " + std::to_string(rowLength) +
                               " features");
    }

    const int depth = config_.depth;
    const size_t n = y.size();
    const bool parallel = n > static_cast<size_t>(config_.parallelThreshold);

    auto totalStart = std::chrono::high_resolution_clock::now();
    if (config_.verbose) {
        std::cout << "Training CFM (depth " << depth << ", " << toString(config_.subModelType)
                  << " sub-models) on " << n << " samples..." << std::endl;
    }

    // **预分配：按最终深度分配，按下标填充**
    std::vector<LinearModel> subModels(depth);
    std::vector<double> offsets(depth + 2, 0.0);
    std::vector<double> trainingLoss(depth, 0.0);

    std::vector<double> yfit(n);
    const double factor = config_.normalizationFactor;
    for (size_t i = 0; i < n; ++i) {
        yfit[i] = y[i] / factor;
    }
    std::vector<double> residual(n);

    auto solver = createLinearSolver(config_);

    for (int d = 0; d < depth; ++d) {
        auto iterStart = std::chrono::high_resolution_clock::now();

        // **步骤1: 拟合当前层线性子模型**
        try {
            subModels[d] = solver->fit(X, rowLength, yfit);
        } catch (const LinearSolveError& e) {
            throw FitFailure(d, e.what());
        }
        const LinearModel& sub = subModels[d];

        // **步骤2: 残差、最小值与训练损失**
        double minResidual = std::numeric_limits<double>::infinity();
        double sse = 0.0;

        #pragma omp parallel for reduction(min:minResidual) reduction(+:sse) schedule(static, 1024) if(parallel)
        for (size_t i = 0; i < n; ++i) {
            const double r = yfit[i] - sub.predict(&X[i * rowLength]);
            residual[i] = r;
            minResidual = std::min(minResidual, r);
            sse += r * r;
        }

        if (!std::isfinite(sse) || !std::isfinite(minResidual)) {
            throw FitFailure(d, "non-finite residuals");
        }
        trainingLoss[d] = sse / static_cast<double>(n);

        // **步骤3: 避极偏移，保证平移后残差 >= 1**
        offsets[d + 1] = std::abs(minResidual) + 1.0;

        // **步骤4: 下一层目标 = 1 / (残差 + 偏移)**
        if (d + 1 < depth) {
            const double offset = offsets[d + 1];
            #pragma omp parallel for schedule(static, 1024) if(parallel)
            for (size_t i = 0; i < n; ++i) {
                yfit[i] = 1.0 / (residual[i] + offset);
            }
        }

        auto iterEnd = std::chrono::high_resolution_clock::now();
        auto iterTime = std::chrono::duration_cast<std::chrono::milliseconds>(iterEnd - iterStart);

        if (config_.verbose) {
            std::cout << "Depth " << d
                      << " | Loss: " << std::fixed << std::setprecision(6) << trainingLoss[d]
                      << " | Offset: " << offsets[d + 1]
                      << " | Time: " << iterTime.count() << "ms" << std::endl;
        }
    }

    subModels_ = std::move(subModels);
    offsets_ = std::move(offsets);
    trainingLoss_ = std::move(trainingLoss);
    numFeatures_ = rowLength;
    fitted_ = true;

    if (config_.verbose) {
        auto totalEnd = std::chrono::high_resolution_clock::now();
        auto totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(totalEnd - totalStart);
        std::cout << "CFM training completed in " << totalTime.count()
                  << "ms with " << subModels_.size() << " levels" << std::endl;
    }
}

// **自底向上展开：从最深层往外累加**
double ContinuedFractionModel::evaluateRow(const double* sample, int maxDepth,
                                           bool checkPoles, int& poleDepth, double& poleValue) const {
    poleDepth = -1;
    double inner = subModels_[maxDepth - 1].predict(sample);

    for (int d = maxDepth - 1; d >= 1; --d) {
        if (checkPoles && !(inner > 0.0)) {
            poleDepth = d;
            poleValue = inner;
            return std::numeric_limits<double>::quiet_NaN();
        }
        const double r = 1.0 / inner - offsets_[d];
        inner = subModels_[d - 1].predict(sample) + r;
    }
    return inner;
}

double ContinuedFractionModel::predict(const double* sample, int rowLength) const {
    checkFitted();
    return predict(sample, rowLength, config_.depth);
}

double ContinuedFractionModel::predict(const double* sample, int rowLength, int maxDepth) const {
    checkFitted();
    checkRowLength(rowLength);
    const int m = resolveMaxDepth(maxDepth);

    const bool checkPoles = config_.poleHandling == PoleHandling::Throw;
    int poleDepth = -1;
    double poleValue = 0.0;
    const double value = evaluateRow(sample, m, checkPoles, poleDepth, poleValue);
    if (poleDepth >= 0) {
        throw PredictionPole(poleDepth, 0, poleValue);
    }
    return value;
}

std::vector<double> ContinuedFractionModel::predictBatch(const std::vector<double>& X,
                                                         int rowLength) const {
    checkFitted();
    return predictBatch(X, rowLength, config_.depth);
}

std::vector<double> ContinuedFractionModel::predictBatch(const std::vector<double>& X,
                                                         int rowLength,
                                                         int maxDepth) const {
    checkFitted();
    checkRowLength(rowLength);
    const int m = resolveMaxDepth(maxDepth);
    if (X.size() % static_cast<size_t>(rowLength) != 0) {
        throw InvalidParameter("X size is not a multiple of rowLength");
    }

    const size_t n = X.size() / rowLength;
    const bool parallel = n > static_cast<size_t>(config_.parallelThreshold);
    std::vector<double> predictions(n);

    if (config_.poleHandling == PoleHandling::Propagate) {
        #pragma omp parallel for schedule(static, 512) if(parallel)
        for (size_t i = 0; i < n; ++i) {
            int poleDepth = -1;
            double poleValue = 0.0;
            predictions[i] = evaluateRow(&X[i * rowLength], m, false, poleDepth, poleValue);
        }
        return predictions;
    }

    // **Throw 模式：先并行求值，再串行找第一个极点行**
    std::vector<int> poleDepths(n, -1);
    std::vector<double> poleValues(n, 0.0);

    #pragma omp parallel for schedule(static, 512) if(parallel)
    for (size_t i = 0; i < n; ++i) {
        predictions[i] = evaluateRow(&X[i * rowLength], m, true, poleDepths[i], poleValues[i]);
    }

    for (size_t i = 0; i < n; ++i) {
        if (poleDepths[i] >= 0) {
            throw PredictionPole(poleDepths[i], i, poleValues[i]);
        }
    }
    return predictions;
}

double ContinuedFractionModel::meanSquaredError(const std::vector<double>& X,
                                                int rowLength,
                                                const std::vector<double>& yTrue) const {
    checkFitted();
    return meanSquaredError(X, rowLength, yTrue, config_.depth);
}

double ContinuedFractionModel::meanSquaredError(const std::vector<double>& X,
                                                int rowLength,
                                                const std::vector<double>& yTrue,
                                                int maxDepth) const {
    const auto predictions = predictBatch(X, rowLength, maxDepth);
    if (predictions.size() != yTrue.size() || yTrue.empty()) {
        throw InvalidParameter("meanSquaredError: " + std::to_string(predictions.size()) +
                               " predictions vs " + std::to_string(yTrue.size()) + " targets");
    }

    const size_t n = yTrue.size();
    double sse = 0.0;

    #pragma omp parallel for reduction(+:sse) schedule(static, 2048) if(n > static_cast<size_t>(config_.parallelThreshold))
    for (size_t i = 0; i < n; ++i) {
        const double diff = predictions[i] - yTrue[i];
        sse += diff * diff;
    }
    return sse / static_cast<double>(n);
}

const std::vector<LinearModel>& ContinuedFractionModel::getSubModels() const {
    checkFitted();
    return subModels_;
}

const LinearModel& ContinuedFractionModel::getSubModel(int depthIndex) const {
    checkFitted();
    if (depthIndex < 0 || depthIndex >= static_cast<int>(subModels_.size())) {
        throw InvalidParameter("sub-model index " + std::to_string(depthIndex) +
                               " out of range [0, " + std::to_string(subModels_.size()) + ")");
    }
    return subModels_[depthIndex];
}

const std::vector<double>& ContinuedFractionModel::getOffsets() const {
    checkFitted();
    return offsets_;
}

void ContinuedFractionModel::resetState() {
    fitted_ = false;
    subModels_.clear();
    offsets_.clear();
    trainingLoss_.clear();
    numFeatures_ = 0;
}

void ContinuedFractionModel::checkFitted() const {
    if (!fitted_) {
        throw NotFitted("ContinuedFractionModel has not been fitted");
    }
}

int ContinuedFractionModel::resolveMaxDepth(int maxDepth) const {
    const int fittedDepth = static_cast<int>(subModels_.size());
    if (maxDepth < 1 || maxDepth > fittedDepth) {
        throw InvalidParameter("maxDepth must be in [1, " + std::to_string(fittedDepth) +
                               "], got " + std::to_string(maxDepth));
    }
    return maxDepth;
}

void ContinuedFractionModel::checkRowLength(int rowLength) const {
    if (rowLength != numFeatures_) {
        throw InvalidParameter("rowLength " + std::to_string(rowLength) +
                               " does not match fitted feature count " + std::to_string(numFeatures_));
    }
}
