// =============================================================================
// include/cfm/core/CFMConfig.hpp
// =============================================================================
#ifndef CFM_CORE_CFMCONFIG_HPP
#define CFM_CORE_CFMCONFIG_HPP

#include "CFMErrors.hpp"
#include <cmath>
#include <string>

/** 每层线性子模型的拟合方式 */
enum class SubModelType {
    OrdinaryLeastSquares,
    L1Regularized
};

/** 预测时分母为零/为负的处理方式 */
enum class PoleHandling {
    Propagate,   // 不检查，inf/NaN 直接传播
    Throw        // 抛出 PredictionPole
};

inline std::string toString(SubModelType type) {
    return type == SubModelType::L1Regularized ? "lasso" : "ols";
}

struct CFMConfig {
    // 基本参数
    int depth = 1;
    double normalizationFactor = 1.0;     // 拟合前 y /= factor，预测结果需由调用方乘回
    SubModelType subModelType = SubModelType::OrdinaryLeastSquares;
    bool fitIntercept = true;

    // Lasso 参数
    double l1Alpha = 1e-3;
    int l1MaxIterations = 1000;
    double l1Tolerance = 1e-4;

    // 预测控制
    PoleHandling poleHandling = PoleHandling::Propagate;

    // 并行与日志
    int parallelThreshold = 2000;         // 启用OpenMP的最小样本数
    bool verbose = false;

    void validate() const {
        if (depth < 1) {
            throw InvalidParameter("depth must be >= 1, got " + std::to_string(depth));
        }
        if (!(normalizationFactor > 0.0) || !std::isfinite(normalizationFactor)) {
            throw InvalidParameter("normalizationFactor must be a positive finite number");
        }
        if (l1Alpha < 0.0 || !std::isfinite(l1Alpha)) {
            throw InvalidParameter("l1Alpha must be >= 0");
        }
        if (l1MaxIterations < 1) {
            throw InvalidParameter("l1MaxIterations must be >= 1");
        }
        if (!(l1Tolerance > 0.0)) {
            throw InvalidParameter("l1Tolerance must be > 0");
        }
        if (parallelThreshold < 1) {
            throw InvalidParameter("parallelThreshold must be >= 1");
        }
    }
};

#endif // CFM_CORE_CFMCONFIG_HPP
