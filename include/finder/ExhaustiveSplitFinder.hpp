#ifndef EXHAUSTIVE_SPLIT_FINDER_HPP
#define EXHAUSTIVE_SPLIT_FINDER_HPP

#include <tuple>
#include <vector>

/** 穷举分割：每个特征排序后扫描所有相邻不同取值的中点，按 MSE 下降量选最优 */
class ExhaustiveSplitFinder {
public:
    /** 返回 (特征下标, 阈值, 增益)，找不到时特征下标为 -1 */
    std::tuple<int, double, double>
    findBestSplit(const std::vector<double>& data,
                  int rowLength,
                  const std::vector<double>& labels,
                  const std::vector<int>& indices,
                  int minSamplesLeaf) const;
};

#endif // EXHAUSTIVE_SPLIT_FINDER_HPP
