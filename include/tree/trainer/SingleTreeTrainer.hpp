// include/tree/trainer/SingleTreeTrainer.hpp
#ifndef TREE_SINGLE_TRAINER_HPP
#define TREE_SINGLE_TRAINER_HPP

#include "../Node.hpp"
#include "../../finder/ExhaustiveSplitFinder.hpp"
#include <memory>
#include <utility>
#include <vector>

/** 单棵 CART 回归树（MSE 准则，深度优先构建） */
class SingleTreeTrainer {
public:
    SingleTreeTrainer(int maxDepth, int minSamplesLeaf);

    void train(const std::vector<double>& data,
               int rowLength,
               const std::vector<double>& labels);

    double predict(const double* sample) const;

    const Node* getRoot() const { return root_.get(); }

    /** 交出根节点所有权（Boosting 模型保存树时使用） */
    std::unique_ptr<Node> releaseRoot() { return std::move(root_); }

    void getTreeStats(int& depth, int& leafCount) const;

private:
    void splitNode(Node* node,
                   const std::vector<double>& data,
                   int rowLength,
                   const std::vector<double>& labels,
                   std::vector<int>& indices,   // 就地划分
                   int depth);

    void calculateTreeStats(const Node* node,
                            int currentDepth,
                            int& maxDepth,
                            int& leafCount) const;

    int maxDepth_;
    int minSamplesLeaf_;
    ExhaustiveSplitFinder finder_;
    std::unique_ptr<Node> root_;
};

#endif // TREE_SINGLE_TRAINER_HPP
