// =============================================================================
// src/tree/trainer/SingleTreeTrainer.cpp - 递归构建版本
// =============================================================================
#include "tree/trainer/SingleTreeTrainer.hpp"
#include <algorithm>
#include <numeric>

SingleTreeTrainer::SingleTreeTrainer(int maxDepth, int minSamplesLeaf)
    : maxDepth_(maxDepth),
      minSamplesLeaf_(minSamplesLeaf) {}

void SingleTreeTrainer::train(const std::vector<double>& data,
                              int rowLength,
                              const std::vector<double>& labels) {
    root_ = std::make_unique<Node>();

    std::vector<int> rootIndices(labels.size());
    std::iota(rootIndices.begin(), rootIndices.end(), 0);

    splitNode(root_.get(), data, rowLength, labels, rootIndices, 0);
}

void SingleTreeTrainer::splitNode(Node* node,
                                  const std::vector<double>& data,
                                  int rowLength,
                                  const std::vector<double>& labels,
                                  std::vector<int>& indices,
                                  int depth) {
    if (indices.empty()) {
        node->makeLeaf(0.0);
        return;
    }

    // 节点均值与方差
    double sum = 0.0;
    double sumSq = 0.0;
    for (int idx : indices) {
        sum += labels[idx];
        sumSq += labels[idx] * labels[idx];
    }
    const double count = static_cast<double>(indices.size());
    const double nodePrediction = sum / count;
    node->samples = indices.size();
    node->metric = std::max(0.0, sumSq / count - nodePrediction * nodePrediction);

    // 停止条件检查
    if (depth >= maxDepth_ ||
        indices.size() < 2 * static_cast<size_t>(minSamplesLeaf_) ||
        indices.size() < 2) {
        node->makeLeaf(nodePrediction);
        return;
    }

    auto [bestFeat, bestThr, bestGain] =
        finder_.findBestSplit(data, rowLength, labels, indices, minSamplesLeaf_);

    if (bestFeat < 0 || bestGain <= 0) {
        node->makeLeaf(nodePrediction);
        return;
    }

    // **原地分割策略**
    auto partitionPoint = std::partition(indices.begin(), indices.end(),
        [&](int idx) {
            return data[idx * rowLength + bestFeat] <= bestThr;
        });

    std::vector<int> leftIndices(indices.begin(), partitionPoint);
    std::vector<int> rightIndices(partitionPoint, indices.end());

    node->makeInternal(bestFeat, bestThr);
    splitNode(node->leftChild.get(), data, rowLength, labels, leftIndices, depth + 1);
    splitNode(node->rightChild.get(), data, rowLength, labels, rightIndices, depth + 1);
}

double SingleTreeTrainer::predict(const double* sample) const {
    const Node* cur = root_.get();
    while (cur && !cur->isLeaf) {
        const double v = sample[cur->getFeatureIndex()];
        cur = (v <= cur->getThreshold()) ? cur->getLeft() : cur->getRight();
    }
    return cur ? cur->getPrediction() : 0.0;
}

void SingleTreeTrainer::getTreeStats(int& depth, int& leafCount) const {
    depth = 0;
    leafCount = 0;
    calculateTreeStats(root_.get(), 0, depth, leafCount);
}

void SingleTreeTrainer::calculateTreeStats(const Node* node, int currentDepth,
                                           int& maxDepth, int& leafCount) const {
    if (!node) return;

    maxDepth = std::max(maxDepth, currentDepth);

    if (node->isLeaf) {
        leafCount++;
    } else {
        calculateTreeStats(node->getLeft(), currentDepth + 1, maxDepth, leafCount);
        calculateTreeStats(node->getRight(), currentDepth + 1, maxDepth, leafCount);
    }
}
