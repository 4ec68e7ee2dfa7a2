// =============================================================================
// tests/test_DataSplit.cpp
// =============================================================================
#include "pipeline/DataSplit.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <vector>

namespace {

// 第 i 行：y = i，特征 = (i, 10*i)
void makeRows(size_t n, std::vector<double>& X, std::vector<double>& y) {
    for (size_t i = 0; i < n; ++i) {
        y.push_back(static_cast<double>(i));
        X.push_back(static_cast<double>(i));
        X.push_back(10.0 * static_cast<double>(i));
    }
}

}  // namespace

TEST(DataSplitTest, KeepsOrderWithoutShuffle) {
    std::vector<double> X, y;
    makeRows(10, X, y);

    DataParams dp;
    ASSERT_TRUE(splitDataset(X, y, 2, dp, 0.2));
    EXPECT_EQ(dp.rowLength, 2);
    ASSERT_EQ(dp.y_train.size(), 8u);
    ASSERT_EQ(dp.y_test.size(), 2u);
    EXPECT_EQ(dp.X_train.size(), 16u);
    EXPECT_EQ(dp.X_test.size(), 4u);
    EXPECT_EQ(dp.y_train.front(), 0.0);
    EXPECT_EQ(dp.y_test, (std::vector<double>{8.0, 9.0}));
    EXPECT_EQ(dp.X_test, (std::vector<double>{8.0, 80.0, 9.0, 90.0}));
}

TEST(DataSplitTest, ShuffleKeepsRowsIntactAndIsSeeded) {
    std::vector<double> X, y;
    makeRows(20, X, y);

    DataParams a, b;
    ASSERT_TRUE(splitDataset(X, y, 2, a, 0.25, true, 7));
    ASSERT_TRUE(splitDataset(X, y, 2, b, 0.25, true, 7));
    EXPECT_EQ(a.y_train, b.y_train);
    EXPECT_EQ(a.y_test, b.y_test);

    // 特征与标签保持同一行
    for (size_t i = 0; i < a.y_train.size(); ++i) {
        EXPECT_EQ(a.X_train[2 * i], a.y_train[i]);
        EXPECT_EQ(a.X_train[2 * i + 1], 10.0 * a.y_train[i]);
    }

    std::vector<double> all = a.y_train;
    all.insert(all.end(), a.y_test.begin(), a.y_test.end());
    std::sort(all.begin(), all.end());
    EXPECT_EQ(all, y);
}

TEST(DataSplitTest, ZeroTestRatioKeepsEverythingForTraining) {
    std::vector<double> X, y;
    makeRows(5, X, y);

    DataParams dp;
    ASSERT_TRUE(splitDataset(X, y, 2, dp, 0.0));
    EXPECT_EQ(dp.y_train.size(), 5u);
    EXPECT_TRUE(dp.y_test.empty());
}

TEST(DataSplitTest, RejectsInvalidInput) {
    std::vector<double> X, y;
    makeRows(4, X, y);

    DataParams dp;
    EXPECT_FALSE(splitDataset(X, y, 2, dp, 1.0));
    EXPECT_FALSE(splitDataset(X, y, 2, dp, -0.1));
    EXPECT_FALSE(splitDataset(X, y, 3, dp, 0.2));
    EXPECT_FALSE(splitDataset(X, y, 2, dp, 0.9));
}
