// =============================================================================
// include/boosting/model/RegressionBoostingModel.hpp
// =============================================================================
#ifndef BOOSTING_MODEL_REGRESSIONBOOSTINGMODEL_HPP
#define BOOSTING_MODEL_REGRESSIONBOOSTINGMODEL_HPP

#include "tree/Node.hpp"
#include <memory>
#include <utility>
#include <vector>

/**
 * 回归Boosting模型：基准分数 + 若干棵按学习率缩放的回归树
 */
class RegressionBoostingModel {
public:
    struct RegressionTree {
        std::unique_ptr<Node> tree;
        double learningRate;

        RegressionTree(std::unique_ptr<Node> t, double lr)
            : tree(std::move(t)), learningRate(lr) {}
    };

    RegressionBoostingModel() : baseScore_(0.0) {}

    /** 添加新的回归树到模型中 */
    void addTree(std::unique_ptr<Node> tree, double learningRate) {
        trees_.emplace_back(std::move(tree), learningRate);
    }

    /** 单样本回归预测 */
    double predict(const double* sample) const {
        double prediction = baseScore_;
        for (const auto& regTree : trees_) {
            prediction += regTree.learningRate * predictSingleTree(regTree.tree.get(), sample);
        }
        return prediction;
    }

    /** 批量回归预测：按树遍历，提高缓存效率 */
    std::vector<double> predictBatch(const std::vector<double>& X, int rowLength) const {
        const size_t n = X.size() / rowLength;
        std::vector<double> predictions(n, baseScore_);

        for (const auto& regTree : trees_) {
            const Node* root = regTree.tree.get();
            const double lr = regTree.learningRate;

            #pragma omp parallel for schedule(static, 1024) if(n > 1000)
            for (size_t i = 0; i < n; ++i) {
                predictions[i] += lr * predictSingleTree(root, &X[i * rowLength]);
            }
        }
        return predictions;
    }

    size_t getTreeCount() const { return trees_.size(); }

    /** 设置基准分数（训练集标签均值） */
    void setBaseScore(double score) { baseScore_ = score; }
    double getBaseScore() const { return baseScore_; }

    void clear() {
        trees_.clear();
        baseScore_ = 0.0;
    }

private:
    std::vector<RegressionTree> trees_;
    double baseScore_;

    static double predictSingleTree(const Node* tree, const double* sample) {
        const Node* cur = tree;
        while (cur && !cur->isLeaf) {
            cur = (sample[cur->getFeatureIndex()] <= cur->getThreshold()) ? cur->getLeft() : cur->getRight();
        }
        return cur ? cur->getPrediction() : 0.0;
    }
};

#endif // BOOSTING_MODEL_REGRESSIONBOOSTINGMODEL_HPP
