#pragma once

#include "LinearModel.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

struct CFMConfig;

/** 线性求解失败（秩亏、非有限输入等） */
class LinearSolveError : public std::runtime_error {
public:
    explicit LinearSolveError(const std::string& what)
        : std::runtime_error(what) {}
};

class ILinearSolver {
public:
    virtual ~ILinearSolver() = default;

    /** X 为行主序扁平数组，rowLength 为特征数 */
    virtual LinearModel fit(const std::vector<double>& X,
                            int rowLength,
                            const std::vector<double>& y) const = 0;

    virtual std::string name() const = 0;
};

/** 根据配置中的 SubModelType 创建求解器 */
std::unique_ptr<ILinearSolver> createLinearSolver(const CFMConfig& config);
