#ifndef PIPELINE_DATASPLIT_HPP
#define PIPELINE_DATASPLIT_HPP

#include <cstdint>
#include <vector>

struct DataParams {
    std::vector<double> X_train;
    std::vector<double> y_train;
    std::vector<double> X_test;
    std::vector<double> y_test;
    int rowLength = 0; // number of features
};

/**
 * 按 (1 - testRatio) / testRatio 划分 X（扁平化）和 y
 * @param X 输入特征扁平化数组
 * @param y 输入标签数组
 * @param numFeatures 每行特征数（从 DataIO 获得）
 * @param out 输出的训练/测试集
 * @param testRatio 测试集比例，[0, 1)
 * @param shuffle 划分前是否打乱行顺序
 * @param seed 打乱用的随机种子
 */
bool splitDataset(const std::vector<double>& X,
                  const std::vector<double>& y,
                  int numFeatures,
                  DataParams& out,
                  double testRatio = 0.2,
                  bool shuffle = false,
                  uint32_t seed = 42);

#endif // PIPELINE_DATASPLIT_HPP
