#include "pipeline/DataSplit.hpp"
#include <algorithm>
#include <iostream>
#include <numeric>
#include <random>

bool splitDataset(const std::vector<double>& X,
                  const std::vector<double>& y,
                  int numFeatures,
                  DataParams& out,
                  double testRatio,
                  bool shuffle,
                  uint32_t seed) {
    if (!(testRatio >= 0.0 && testRatio < 1.0)) {
        std::cerr << "Error: test ratio must be in [0, 1), got " << testRatio << std::endl;
        return false;
    }
    if (numFeatures < 1 || X.size() != y.size() * static_cast<size_t>(numFeatures)) {
        std::cerr << "Error: cannot split " << X.size() << " feature values into "
                  << y.size() << " rows of " << numFeatures << std::endl;
        return false;
    }

    const size_t totalRows = y.size();
    const size_t trainRows = static_cast<size_t>(static_cast<double>(totalRows) * (1.0 - testRatio));
    if (trainRows == 0) {
        std::cerr << "Error: training split would be empty (" << totalRows << " rows)" << std::endl;
        return false;
    }

    // 行顺序：默认保持原序，shuffle 时用固定种子打乱
    std::vector<size_t> order(totalRows);
    std::iota(order.begin(), order.end(), 0);
    if (shuffle) {
        std::mt19937 gen(seed);
        std::shuffle(order.begin(), order.end(), gen);
    }

    const size_t feat = static_cast<size_t>(numFeatures);
    out.rowLength = numFeatures;
    out.X_train.clear();
    out.y_train.clear();
    out.X_test.clear();
    out.y_test.clear();
    out.X_train.reserve(trainRows * feat);
    out.y_train.reserve(trainRows);
    out.X_test.reserve((totalRows - trainRows) * feat);
    out.y_test.reserve(totalRows - trainRows);

    for (size_t k = 0; k < totalRows; ++k) {
        const size_t row = order[k];
        auto first = X.begin() + row * feat;
        if (k < trainRows) {
            out.X_train.insert(out.X_train.end(), first, first + feat);
            out.y_train.push_back(y[row]);
        } else {
            out.X_test.insert(out.X_test.end(), first, first + feat);
            out.y_test.push_back(y[row]);
        }
    }
    return true;
}
