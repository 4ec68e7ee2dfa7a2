// =============================================================================
// src/functions/io/DataIO.cpp - 表格格式读取
// =============================================================================
#include "functions/io/DataIO.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

namespace {

bool isBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

// 按头部声明预分配的元素上限
constexpr size_t kMaxReservedValues = size_t(1) << 20;

std::string lineError(const std::string& filename, size_t lineNo, const std::string& msg) {
    return filename + ":" + std::to_string(lineNo) + ": " + msg;
}

}  // namespace

std::pair<std::vector<double>, std::vector<double>>
DataIO::readTabular(const std::string& filename, int& numFeatures) {
    std::vector<double> flattenedFeatures;
    std::vector<double> labels;
    numFeatures = 0;

    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Unable to open file: " << filename << std::endl;
        return {std::move(flattenedFeatures), std::move(labels)};
    }

    std::string line;
    size_t lineNo = 0;

    // **头部：N M**
    long long declaredRows = -1;
    long long declaredFeatures = -1;
    while (std::getline(file, line)) {
        ++lineNo;
        if (isBlank(line)) continue;
        std::istringstream header(line);
        if (!(header >> declaredRows >> declaredFeatures) || declaredRows <= 0 || declaredFeatures <= 0) {
            throw std::runtime_error(lineError(filename, lineNo,
                "header must contain a positive sample count and feature count"));
        }
        if (declaredFeatures >= std::numeric_limits<int>::max()) {
            throw std::runtime_error(lineError(filename, lineNo,
                "feature count " + std::to_string(declaredFeatures) + " is out of range"));
        }
        break;
    }
    if (declaredRows <= 0) {
        throw std::runtime_error(filename + ": missing header line");
    }

    const size_t rows = static_cast<size_t>(declaredRows);
    const size_t features = static_cast<size_t>(declaredFeatures);

    // **预分配容器：头部只是声明，预留量设上限，实际按读到的行增长**
    const size_t reservedRows = std::min(rows, kMaxReservedValues);
    labels.reserve(reservedRows);
    flattenedFeatures.reserve(std::min(reservedRows * features, kMaxReservedValues));

    std::vector<double> row;
    row.reserve(std::min(features + 1, kMaxReservedValues));

    size_t extraRows = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        if (isBlank(line)) continue;
        if (labels.size() == rows) {
            ++extraRows;
            continue;
        }

        row.clear();
        std::istringstream ss(line);
        std::string token;
        while (ss >> token) {
            try {
                size_t consumed = 0;
                const double value = std::stod(token, &consumed);
                if (consumed != token.size()) {
                    throw std::invalid_argument(token);
                }
                row.push_back(value);
            } catch (const std::exception&) {
                throw std::runtime_error(lineError(filename, lineNo,
                    "cannot parse value '" + token + "' as double"));
            }
        }

        if (row.size() != features + 1) {
            throw std::runtime_error(lineError(filename, lineNo,
                "expected " + std::to_string(features + 1) + " values, got " +
                std::to_string(row.size())));
        }

        // 第一列为目标值，其余为特征
        labels.push_back(row.front());
        flattenedFeatures.insert(flattenedFeatures.end(), row.begin() + 1, row.end());
    }

    if (labels.size() < rows) {
        throw std::runtime_error(filename + ": header announces " + std::to_string(rows) +
                                 " samples but only " + std::to_string(labels.size()) + " were found");
    }
    if (extraRows > 0) {
        std::cerr << "Warning: ignoring " << extraRows << " rows beyond the declared "
                  << rows << " samples in " << filename << std::endl;
    }

    numFeatures = static_cast<int>(features);
    if (verbose_) {
        std::cout << "Loaded " << labels.size() << " samples with "
                  << numFeatures << " features each" << std::endl;
    }

    return {std::move(flattenedFeatures), std::move(labels)};
}

void DataIO::writeResults(const std::vector<double>& results,
                          const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Unable to open file: " << filename << std::endl;
        return;
    }

    file.precision(10);
    file << std::fixed;

    for (const auto& r : results) {
        file << r << '\n';
    }
}

bool DataIO::validateData(const std::vector<double>& flattenedFeatures,
                          const std::vector<double>& labels,
                          int numFeatures) {
    if (labels.empty()) {
        std::cerr << "Error: No labels found" << std::endl;
        return false;
    }
    if (numFeatures < 1) {
        std::cerr << "Error: Invalid feature count " << numFeatures << std::endl;
        return false;
    }

    const size_t expectedFeatureCount = labels.size() * static_cast<size_t>(numFeatures);
    if (flattenedFeatures.size() != expectedFeatureCount) {
        std::cerr << "Error: Feature count mismatch. Expected: "
                  << expectedFeatureCount << ", Got: " << flattenedFeatures.size() << std::endl;
        return false;
    }

    const auto invalidFeature = std::find_if(flattenedFeatures.begin(), flattenedFeatures.end(),
        [](double val) { return !std::isfinite(val); });
    if (invalidFeature != flattenedFeatures.end()) {
        std::cerr << "Warning: Found non-finite feature values" << std::endl;
    }

    const auto invalidLabel = std::find_if(labels.begin(), labels.end(),
        [](double val) { return !std::isfinite(val); });
    if (invalidLabel != labels.end()) {
        std::cerr << "Warning: Found non-finite label values" << std::endl;
    }

    return true;
}
