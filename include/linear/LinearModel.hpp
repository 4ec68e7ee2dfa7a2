// =============================================================================
// include/linear/LinearModel.hpp
// =============================================================================
#ifndef LINEAR_LINEARMODEL_HPP
#define LINEAR_LINEARMODEL_HPP

#include <vector>
#include <cstddef>
#include <utility>

/**
 * 已拟合的线性模型：f(x) = intercept + sum_j w_j * x_j
 * 连分式模型每一层持有一个
 */
class LinearModel {
public:
    LinearModel() : intercept_(0.0) {}

    LinearModel(std::vector<double> coefficients, double intercept)
        : coefficients_(std::move(coefficients)), intercept_(intercept) {}

    /** 单样本预测 */
    double predict(const double* sample) const {
        double value = intercept_;
        for (size_t j = 0; j < coefficients_.size(); ++j) {
            value += coefficients_[j] * sample[j];
        }
        return value;
    }

    /** 批量预测 */
    std::vector<double> predictBatch(const std::vector<double>& X, int rowLength) const {
        const size_t n = X.size() / rowLength;
        std::vector<double> predictions(n);

        #pragma omp parallel for schedule(static, 1024) if(n > 2000)
        for (size_t i = 0; i < n; ++i) {
            predictions[i] = predict(&X[i * rowLength]);
        }
        return predictions;
    }

    const std::vector<double>& getCoefficients() const { return coefficients_; }
    double getIntercept() const { return intercept_; }
    int getNumFeatures() const { return static_cast<int>(coefficients_.size()); }

private:
    std::vector<double> coefficients_;
    double intercept_;
};

#endif // LINEAR_LINEARMODEL_HPP
