// include/linear/LassoSolver.hpp
#ifndef LINEAR_LASSOSOLVER_HPP
#define LINEAR_LASSOSOLVER_HPP

#include "ILinearSolver.hpp"

/**
 * L1 正则线性回归（Lasso），循环坐标下降 + 软阈值
 * 目标函数：(1/2N) * ||y - Xw - b||^2 + alpha * ||w||_1
 */
class LassoSolver : public ILinearSolver {
public:
    LassoSolver(double alpha,
                int maxIterations = 1000,
                double tolerance = 1e-4,
                bool fitIntercept = true);

    LinearModel fit(const std::vector<double>& X,
                    int rowLength,
                    const std::vector<double>& y) const override;

    std::string name() const override { return "lasso"; }

    double alpha() const { return alpha_; }

    /** 软阈值算子 S(z, t) = sign(z) * max(|z| - t, 0) */
    static double softThreshold(double z, double threshold);

private:
    double alpha_;
    int maxIterations_;
    double tolerance_;
    bool fitIntercept_;
};

#endif // LINEAR_LASSOSOLVER_HPP
