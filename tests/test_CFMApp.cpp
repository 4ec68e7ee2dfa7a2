// =============================================================================
// tests/test_CFMApp.cpp
// =============================================================================
#include "cfm/app/CFMApp.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

CFMOptions parseArgs(const std::vector<std::string>& args) {
    std::vector<std::string> storage = args;
    storage.insert(storage.begin(), "cfrac");
    std::vector<char*> argv;
    for (auto& arg : storage) {
        argv.push_back(&arg[0]);
    }
    return parseCFMCommandLine(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST(CFMAppTest, PositionalArgumentsFillOptions) {
    const CFMOptions opts = parseArgs({"data.txt", "4", "10", "lasso:0.01", "0.3",
                                       "0", "-", "throw", "0", "7"});
    EXPECT_EQ(opts.dataPath, "data.txt");
    EXPECT_EQ(opts.depth, 4);
    EXPECT_DOUBLE_EQ(opts.normalizationFactor, 10.0);
    EXPECT_EQ(opts.subModel, "lasso:0.01");
    EXPECT_DOUBLE_EQ(opts.testRatio, 0.3);
    EXPECT_EQ(opts.baselineIterations, 0);
    EXPECT_TRUE(opts.outputPath.empty());
    EXPECT_TRUE(opts.failOnPole);
    EXPECT_FALSE(opts.shuffle);
    EXPECT_EQ(opts.seed, 7u);
}

TEST(CFMAppTest, DefaultsWhenArgumentsAreOmitted) {
    const CFMOptions opts = parseArgs({"data.txt"});
    EXPECT_EQ(opts.depth, 3);
    EXPECT_EQ(opts.subModel, "ols");
    EXPECT_FALSE(opts.failOnPole);
    EXPECT_TRUE(opts.shuffle);
    EXPECT_EQ(opts.seed, 42u);
}

TEST(CFMAppTest, PoleModeSelectsPoleHandling) {
    EXPECT_FALSE(parsePoleMode("propagate"));
    EXPECT_TRUE(parsePoleMode("throw"));
    EXPECT_THROW(parsePoleMode("ignore"), std::invalid_argument);

    CFMOptions opts;
    opts.failOnPole = true;
    EXPECT_EQ(makeCFMConfig(opts).poleHandling, PoleHandling::Throw);
    opts.failOnPole = false;
    EXPECT_EQ(makeCFMConfig(opts).poleHandling, PoleHandling::Propagate);
}

TEST(CFMAppTest, SubModelStringSelectsSolver) {
    CFMOptions opts;
    opts.subModel = "lasso:0.25";
    const CFMConfig lasso = makeCFMConfig(opts);
    EXPECT_EQ(lasso.subModelType, SubModelType::L1Regularized);
    EXPECT_DOUBLE_EQ(lasso.l1Alpha, 0.25);

    opts.subModel = "ridge";
    EXPECT_THROW(makeCFMConfig(opts), std::invalid_argument);

    opts.subModel = "ols";
    opts.depth = 0;
    EXPECT_THROW(makeCFMConfig(opts), InvalidParameter);
}

TEST(CFMAppTest, RunsEndToEndInThrowMode) {
    const std::string dataPath = ::testing::TempDir() + "cfrac_app_data.txt";
    const std::string outPath = ::testing::TempDir() + "cfrac_app_pred.txt";
    {
        std::ofstream out(dataPath);
        out << "20\t1\n";
        for (int i = 1; i <= 20; ++i) {
            out << (3.0 * i + 1.0 / i) << '\t' << i << '\n';
        }
    }

    CFMOptions opts;
    opts.dataPath = dataPath;
    opts.depth = 2;
    opts.failOnPole = true;
    opts.baselineIterations = 5;
    opts.verbose = false;
    EXPECT_NO_THROW(runCFMApp(opts));

    opts.failOnPole = false;
    opts.outputPath = outPath;
    EXPECT_NO_THROW(runCFMApp(opts));

    std::ifstream in(outPath);
    std::vector<double> predictions;
    double v = 0.0;
    while (in >> v) predictions.push_back(v);
    EXPECT_EQ(predictions.size(), 4u);

    std::remove(dataPath.c_str());
    std::remove(outPath.c_str());
}

TEST(CFMAppTest, MissingDataFileIsAnError) {
    CFMOptions opts;
    opts.dataPath = ::testing::TempDir() + "cfrac_app_missing.txt";
    opts.verbose = false;
    EXPECT_THROW(runCFMApp(opts), std::runtime_error);
}
