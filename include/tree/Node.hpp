#pragma once

#include <memory>
#include <cstddef>

/** 回归树节点：内部节点按 (featureIndex, threshold) 分裂，叶子保存预测值 */
struct Node {
    bool   isLeaf      = false;
    size_t samples     = 0;
    double metric      = 0.0;      // 节点目标方差

    int    featureIndex = -1;
    double threshold    = 0.0;
    double prediction   = 0.0;

    std::unique_ptr<Node> leftChild  = nullptr;
    std::unique_ptr<Node> rightChild = nullptr;

    void makeLeaf(double value) {
        isLeaf = true;
        prediction = value;
        featureIndex = -1;
        leftChild.reset();
        rightChild.reset();
    }

    void makeInternal(int feature, double thr) {
        isLeaf = false;
        featureIndex = feature;
        threshold = thr;
        leftChild = std::make_unique<Node>();
        rightChild = std::make_unique<Node>();
    }

    int getFeatureIndex() const { return isLeaf ? -1 : featureIndex; }
    double getThreshold() const { return isLeaf ? 0.0 : threshold; }
    double getPrediction() const { return isLeaf ? prediction : 0.0; }
    const Node* getLeft() const { return isLeaf ? nullptr : leftChild.get(); }
    const Node* getRight() const { return isLeaf ? nullptr : rightChild.get(); }
};
