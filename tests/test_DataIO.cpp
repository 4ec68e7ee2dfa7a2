// =============================================================================
// tests/test_DataIO.cpp
// =============================================================================
#include "functions/io/DataIO.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

class DataIOTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& path : created_) {
            std::remove(path.c_str());
        }
    }

    std::string writeFile(const std::string& name, const std::string& contents) {
        const std::string path = ::testing::TempDir() + name;
        std::ofstream out(path);
        out << contents;
        created_.push_back(path);
        return path;
    }

    DataIO io_;
    std::vector<std::string> created_;
};

}  // namespace

TEST_F(DataIOTest, ReadsHeaderTargetAndFeatures) {
    const auto path = writeFile("cfrac_io_ok.txt",
        "3\t2\n"
        "10.5\t1.0\t2.0\n"
        "20.0\t3.0\t4.0\n"
        "-1e2\t5.5\t6.5\n");

    int numFeatures = 0;
    auto [X, y] = io_.readTabular(path, numFeatures);

    EXPECT_EQ(numFeatures, 2);
    EXPECT_EQ(y, (std::vector<double>{10.5, 20.0, -100.0}));
    EXPECT_EQ(X, (std::vector<double>{1.0, 2.0, 3.0, 4.0, 5.5, 6.5}));
    EXPECT_TRUE(io_.validateData(X, y, numFeatures));
}

TEST_F(DataIOTest, AcceptsSpacesAndBlankLines) {
    const auto path = writeFile("cfrac_io_spaces.txt",
        "2 1\n"
        "\n"
        "1.0   2.0\n"
        "   \n"
        "3.0 4.0\n");

    int numFeatures = 0;
    auto [X, y] = io_.readTabular(path, numFeatures);
    EXPECT_EQ(numFeatures, 1);
    EXPECT_EQ(y, (std::vector<double>{1.0, 3.0}));
    EXPECT_EQ(X, (std::vector<double>{2.0, 4.0}));
}

TEST_F(DataIOTest, IgnoresRowsBeyondDeclaredCount) {
    const auto path = writeFile("cfrac_io_extra.txt",
        "1\t1\n"
        "1.0\t2.0\n"
        "3.0\t4.0\n");

    int numFeatures = 0;
    auto [X, y] = io_.readTabular(path, numFeatures);
    EXPECT_EQ(y.size(), 1u);
    EXPECT_EQ(X.size(), 1u);
}

TEST_F(DataIOTest, MissingFileYieldsEmptyData) {
    int numFeatures = 7;
    auto [X, y] = io_.readTabular(::testing::TempDir() + "cfrac_does_not_exist.txt", numFeatures);
    EXPECT_TRUE(X.empty());
    EXPECT_TRUE(y.empty());
    EXPECT_EQ(numFeatures, 0);
}

TEST_F(DataIOTest, MalformedHeaderThrows) {
    int numFeatures = 0;
    EXPECT_THROW(io_.readTabular(writeFile("cfrac_io_h1.txt", "abc\n1 2\n"), numFeatures),
                 std::runtime_error);
    EXPECT_THROW(io_.readTabular(writeFile("cfrac_io_h2.txt", "0 2\n"), numFeatures),
                 std::runtime_error);
    EXPECT_THROW(io_.readTabular(writeFile("cfrac_io_h3.txt", ""), numFeatures),
                 std::runtime_error);
}

TEST_F(DataIOTest, WrongValueCountThrows) {
    int numFeatures = 0;
    const auto path = writeFile("cfrac_io_count.txt",
        "2\t2\n"
        "1.0\t2.0\t3.0\n"
        "4.0\t5.0\n");
    EXPECT_THROW(io_.readTabular(path, numFeatures), std::runtime_error);
}

TEST_F(DataIOTest, UnparsableValueThrows) {
    int numFeatures = 0;
    const auto path = writeFile("cfrac_io_value.txt",
        "1\t1\n"
        "1.0\t2.0x\n");
    EXPECT_THROW(io_.readTabular(path, numFeatures), std::runtime_error);
}

TEST_F(DataIOTest, TooFewRowsThrows) {
    int numFeatures = 0;
    const auto path = writeFile("cfrac_io_short.txt",
        "3\t1\n"
        "1.0\t2.0\n");
    EXPECT_THROW(io_.readTabular(path, numFeatures), std::runtime_error);
}

TEST_F(DataIOTest, OversizedHeaderFailsOnRowsNotAllocation) {
    int numFeatures = 0;
    // 声明的规模远超实际内容，应报告行错误而不是分配失败
    const auto huge = writeFile("cfrac_io_huge.txt",
        "1000000000000 1000000\n"
        "1.0 2.0\n");
    EXPECT_THROW(io_.readTabular(huge, numFeatures), std::runtime_error);

    const auto manyRows = writeFile("cfrac_io_many.txt",
        "1000000000000 1\n"
        "1.0 2.0\n");
    try {
        io_.readTabular(manyRows, numFeatures);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("header announces"), std::string::npos) << e.what();
    }
}

TEST_F(DataIOTest, FeatureCountBeyondIntRangeThrows) {
    int numFeatures = 0;
    const auto path = writeFile("cfrac_io_wide.txt",
        "1 3000000000\n"
        "1.0 2.0\n");
    try {
        io_.readTabular(path, numFeatures);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("out of range"), std::string::npos) << e.what();
    }
}

TEST_F(DataIOTest, QuietReaderPrintsNothing) {
    const auto path = writeFile("cfrac_io_quiet.txt",
        "1\t1\n"
        "1.0\t2.0\n");

    DataIO quiet(false);
    int numFeatures = 0;
    ::testing::internal::CaptureStdout();
    auto [X, y] = quiet.readTabular(path, numFeatures);
    const std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_TRUE(out.empty()) << out;
    EXPECT_EQ(y.size(), 1u);
    EXPECT_EQ(numFeatures, 1);
}

TEST_F(DataIOTest, WritesOnePredictionPerLine) {
    const std::string path = ::testing::TempDir() + "cfrac_io_out.txt";
    created_.push_back(path);
    io_.writeResults({1.5, -2.25}, path);

    std::ifstream in(path);
    std::vector<double> values;
    double v = 0.0;
    while (in >> v) values.push_back(v);
    EXPECT_EQ(values, (std::vector<double>{1.5, -2.25}));
}

TEST_F(DataIOTest, ValidateDataChecksShape) {
    EXPECT_FALSE(io_.validateData({1.0, 2.0, 3.0}, {1.0, 2.0}, 2));
    EXPECT_FALSE(io_.validateData({}, {}, 1));
    EXPECT_FALSE(io_.validateData({1.0}, {1.0}, 0));
    EXPECT_TRUE(io_.validateData({1.0, 2.0}, {1.0, 2.0}, 1));
}
