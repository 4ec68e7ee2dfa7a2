#pragma once

#include <string>
#include <vector>

/** 回归器公共接口：连分式模型与 GBRT 基线都实现它，便于并排比较 */
class IRegressor {
public:
    virtual ~IRegressor() = default;

    virtual void fit(const std::vector<double>& X,
                     int rowLength,
                     const std::vector<double>& y) = 0;

    virtual std::vector<double> predictBatch(const std::vector<double>& X,
                                             int rowLength) const = 0;

    virtual std::string name() const = 0;
};
