// =============================================================================
// src/linear/OLSSolver.cpp - Eigen QR 版本
// =============================================================================
#include "linear/OLSSolver.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace {

using RowMajorMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// 相对最大主元的秩判定阈值
constexpr double kRankThreshold = 1e-10;

}  // namespace

LinearModel OLSSolver::fit(const std::vector<double>& X,
                           int rowLength,
                           const std::vector<double>& y) const {
    if (rowLength < 1 || y.empty() || X.size() != y.size() * static_cast<size_t>(rowLength)) {
        throw std::invalid_argument("OLSSolver: X must have y.size() rows of rowLength features");
    }

    const Eigen::Index n = static_cast<Eigen::Index>(y.size());
    const Eigen::Index p = rowLength;

    Eigen::Map<const RowMajorMatrix> Xmap(X.data(), n, p);
    Eigen::Map<const Eigen::VectorXd> ymap(y.data(), n);

    if (!Xmap.allFinite() || !ymap.allFinite()) {
        throw LinearSolveError("non-finite values in design matrix or target");
    }

    // 截距需要额外一个自由度
    const Eigen::Index required = fitIntercept_ ? p + 1 : p;
    if (n < required) {
        throw LinearSolveError("rank-deficient design: " + std::to_string(n) +
                               " samples for " + std::to_string(required) + " parameters");
    }

    // **中心化：截距与系数分开求解**
    Eigen::VectorXd xMeans = Eigen::VectorXd::Zero(p);
    double yMean = 0.0;
    Eigen::MatrixXd Xc = Xmap;
    Eigen::VectorXd yc = ymap;
    if (fitIntercept_) {
        xMeans = Xmap.colwise().mean().transpose();
        yMean = ymap.mean();
        Xc.rowwise() -= xMeans.transpose();
        yc.array() -= yMean;
    }

    Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(n, p);
    qr.setThreshold(kRankThreshold);
    qr.compute(Xc);

    if (qr.rank() < p) {
        throw LinearSolveError("rank-deficient design matrix (rank " + std::to_string(qr.rank()) +
                               " of " + std::to_string(p) + " features)");
    }

    Eigen::VectorXd beta = qr.solve(yc);
    if (!beta.allFinite()) {
        throw LinearSolveError("least-squares solution is not finite");
    }

    const double intercept = fitIntercept_ ? yMean - xMeans.dot(beta) : 0.0;
    return LinearModel(std::vector<double>(beta.data(), beta.data() + beta.size()), intercept);
}
