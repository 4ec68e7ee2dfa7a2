// =============================================================================
// include/functions/io/DataIO.hpp
// =============================================================================
#pragma once

#include <vector>
#include <string>
#include <utility>

/**
 * 数据文件格式（空白/制表符分隔）：
 *   第一行：样本数 N  特征数 M
 *   之后 N 行：target f_1 ... f_M
 */
class DataIO {
public:
    explicit DataIO(bool verbose = true) : verbose_(verbose) {}

    // **核心方法：读取特征矩阵（扁平化）与目标向量**
    std::pair<std::vector<double>, std::vector<double>>
    readTabular(const std::string& filename, int& numFeatures);

    void writeResults(const std::vector<double>& results,
                      const std::string& filename);

    // **数据验证：形状检查 + 非有限值警告**
    bool validateData(const std::vector<double>& flattenedFeatures,
                      const std::vector<double>& labels,
                      int numFeatures);

private:
    bool verbose_;
};
