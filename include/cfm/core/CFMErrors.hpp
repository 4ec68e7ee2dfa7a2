// =============================================================================
// include/cfm/core/CFMErrors.hpp
// =============================================================================
#ifndef CFM_CORE_CFMERRORS_HPP
#define CFM_CORE_CFMERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

/** 参数非法：depth <= 0、maxDepth 越界、X/y 行数不匹配等 */
class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& what)
        : std::invalid_argument(what) {}
};

/** 模型尚未训练就调用了预测 */
class NotFitted : public std::logic_error {
public:
    explicit NotFitted(const std::string& what)
        : std::logic_error(what) {}
};

/** 某一层线性子模型求解失败（奇异/病态），附带失败的层索引 */
class FitFailure : public std::runtime_error {
public:
    FitFailure(int depth, const std::string& reason)
        : std::runtime_error("fit failed at depth " + std::to_string(depth) + ": " + reason),
          depth_(depth) {}

    int depth() const noexcept { return depth_; }

private:
    int depth_;
};

/** 预测时遇到非正分母（仅在 PoleHandling::Throw 模式下抛出） */
class PredictionPole : public std::runtime_error {
public:
    PredictionPole(int depth, size_t row, double denominator)
        : std::runtime_error("prediction pole at depth " + std::to_string(depth) +
                             ", row " + std::to_string(row) +
                             " (denominator = " + std::to_string(denominator) + ")"),
          depth_(depth), row_(row) {}

    int depth() const noexcept { return depth_; }
    size_t row() const noexcept { return row_; }

private:
    int depth_;
    size_t row_;
};

#endif // CFM_CORE_CFMERRORS_HPP
