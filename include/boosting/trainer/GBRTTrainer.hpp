// =============================================================================
// include/boosting/trainer/GBRTTrainer.hpp - 对照基线
// =============================================================================
#pragma once

#include "../model/RegressionBoostingModel.hpp"
#include "regressor/IRegressor.hpp"
#include <string>
#include <vector>

struct GBRTConfig {
    int numIterations = 100;
    double learningRate = 0.1;
    int maxDepth = 4;
    int minSamplesLeaf = 1;
    bool verbose = false;
};

/** 平方损失梯度提升回归树，仅用于与连分式模型并排比较 */
class GBRTTrainer : public IRegressor {
public:
    explicit GBRTTrainer(const GBRTConfig& config);

    void fit(const std::vector<double>& X,
             int rowLength,
             const std::vector<double>& y) override;

    double predict(const double* sample, int rowLength) const;

    std::vector<double> predictBatch(const std::vector<double>& X,
                                     int rowLength) const override;

    void evaluate(const std::vector<double>& X,
                  int rowLength,
                  const std::vector<double>& y,
                  double& mse,
                  double& mae) const;

    const RegressionBoostingModel* getModel() const { return &model_; }
    std::string name() const override { return "GBRT"; }

    /** 每轮迭代前的训练损失 0.5 * mean((y - F)^2) */
    const std::vector<double>& getTrainingLoss() const { return trainingLoss_; }

    bool isFitted() const { return fitted_; }

private:
    GBRTConfig config_;
    RegressionBoostingModel model_;
    std::vector<double> trainingLoss_;
    int numFeatures_ = 0;
    bool fitted_ = false;

    void checkFitted(int rowLength) const;
};
