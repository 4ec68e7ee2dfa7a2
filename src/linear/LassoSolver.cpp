// =============================================================================
// src/linear/LassoSolver.cpp - 坐标下降版本
// =============================================================================
#include "linear/LassoSolver.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

namespace {

using RowMajorMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

}  // namespace

LassoSolver::LassoSolver(double alpha, int maxIterations, double tolerance, bool fitIntercept)
    : alpha_(alpha), maxIterations_(maxIterations), tolerance_(tolerance), fitIntercept_(fitIntercept) {
    if (alpha_ < 0.0 || !std::isfinite(alpha_)) {
        throw std::invalid_argument("LassoSolver: alpha must be >= 0");
    }
    if (maxIterations_ < 1) {
        throw std::invalid_argument("LassoSolver: maxIterations must be >= 1");
    }
    if (!(tolerance_ > 0.0)) {
        throw std::invalid_argument("LassoSolver: tolerance must be > 0");
    }
}

double LassoSolver::softThreshold(double z, double threshold) {
    if (z > threshold) return z - threshold;
    if (z < -threshold) return z + threshold;
    return 0.0;
}

LinearModel LassoSolver::fit(const std::vector<double>& X,
                             int rowLength,
                             const std::vector<double>& y) const {
    if (rowLength < 1 || y.empty() || X.size() != y.size() * static_cast<size_t>(rowLength)) {
        throw std::invalid_argument("LassoSolver: X must have y.size() rows of rowLength features");
    }

    const Eigen::Index n = static_cast<Eigen::Index>(y.size());
    const Eigen::Index p = rowLength;

    Eigen::Map<const RowMajorMatrix> Xmap(X.data(), n, p);
    Eigen::Map<const Eigen::VectorXd> ymap(y.data(), n);

    if (!Xmap.allFinite() || !ymap.allFinite()) {
        throw LinearSolveError("non-finite values in design matrix or target");
    }

    Eigen::VectorXd xMeans = Eigen::VectorXd::Zero(p);
    double yMean = 0.0;
    Eigen::MatrixXd Xc = Xmap;
    if (fitIntercept_) {
        xMeans = Xmap.colwise().mean().transpose();
        yMean = ymap.mean();
        Xc.rowwise() -= xMeans.transpose();
    }

    // 列平方范数，零方差列系数恒为0
    const Eigen::VectorXd colNormSq = Xc.colwise().squaredNorm().transpose();
    const double penalty = alpha_ * static_cast<double>(n);

    Eigen::VectorXd w = Eigen::VectorXd::Zero(p);
    Eigen::VectorXd residual = ymap.array() - yMean;

    bool converged = false;
    int iter = 0;
    for (; iter < maxIterations_ && !converged; ++iter) {
        double maxDelta = 0.0;
        double maxWeight = 0.0;

        for (Eigen::Index j = 0; j < p; ++j) {
            if (colNormSq(j) <= 0.0) continue;

            const double wOld = w(j);
            const double rho = Xc.col(j).dot(residual) + wOld * colNormSq(j);
            const double wNew = softThreshold(rho, penalty) / colNormSq(j);

            if (wNew != wOld) {
                residual.noalias() -= (wNew - wOld) * Xc.col(j);
                w(j) = wNew;
            }
            maxDelta = std::max(maxDelta, std::abs(wNew - wOld));
            maxWeight = std::max(maxWeight, std::abs(wNew));
        }

        if (maxWeight == 0.0 || maxDelta / maxWeight < tolerance_) {
            converged = true;
        }
    }

    if (!converged) {
        std::cerr << "Warning: Lasso coordinate descent did not converge after "
                  << maxIterations_ << " iterations (alpha = " << alpha_ << ")" << std::endl;
    }

    if (!w.allFinite()) {
        throw LinearSolveError("lasso solution is not finite");
    }

    const double intercept = fitIntercept_ ? yMean - xMeans.dot(w) : 0.0;
    return LinearModel(std::vector<double>(w.data(), w.data() + w.size()), intercept);
}
