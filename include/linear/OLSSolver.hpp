// include/linear/OLSSolver.hpp
#ifndef LINEAR_OLSSOLVER_HPP
#define LINEAR_OLSSOLVER_HPP

#include "ILinearSolver.hpp"

/** 普通最小二乘：中心化后用列主元 Householder QR 求解 */
class OLSSolver : public ILinearSolver {
public:
    explicit OLSSolver(bool fitIntercept = true) : fitIntercept_(fitIntercept) {}

    LinearModel fit(const std::vector<double>& X,
                    int rowLength,
                    const std::vector<double>& y) const override;

    std::string name() const override { return "ols"; }

private:
    bool fitIntercept_;
};

#endif // LINEAR_OLSSOLVER_HPP
