// =============================================================================
// include/cfm/model/ContinuedFractionModel.hpp
// =============================================================================
#ifndef CFM_MODEL_CONTINUEDFRACTIONMODEL_HPP
#define CFM_MODEL_CONTINUEDFRACTIONMODEL_HPP

#include "cfm/core/CFMConfig.hpp"
#include "linear/LinearModel.hpp"
#include "regressor/IRegressor.hpp"
#include <string>
#include <vector>

/**
 * 连分式回归模型：
 *   f(x) = L0(x) + 1/(L1(x) + 1/(L2(x) + ...)) ，每层减去对应的偏移量
 * 第 d 层线性子模型拟合的是第 d-1 层残差平移后的倒数。
 * 偏移序列长度为 depth+2，首尾两位恒为0。
 */
class ContinuedFractionModel : public IRegressor {
public:
    explicit ContinuedFractionModel(const CFMConfig& config);

    /** 由已有子模型与偏移量组装一个已训练模型（内存状态，不涉及文件） */
    static ContinuedFractionModel fromComponents(const CFMConfig& config,
                                                 std::vector<LinearModel> subModels,
                                                 std::vector<double> offsets);

    /** 按配置的 depth 训练 */
    void fit(const std::vector<double>& X,
             int rowLength,
             const std::vector<double>& y) override;

    /** 覆盖配置中的 depth 后训练 */
    void fit(const std::vector<double>& X,
             int rowLength,
             const std::vector<double>& y,
             int depth);

    /** 单样本预测（完整深度 / 截断到 maxDepth） */
    double predict(const double* sample, int rowLength) const;
    double predict(const double* sample, int rowLength, int maxDepth) const;

    /** 批量预测，行间可并行 */
    std::vector<double> predictBatch(const std::vector<double>& X,
                                     int rowLength) const override;
    std::vector<double> predictBatch(const std::vector<double>& X,
                                     int rowLength,
                                     int maxDepth) const;

    /** sum((predict(X) - y)^2) / n，inf/NaN 原样传播 */
    double meanSquaredError(const std::vector<double>& X,
                            int rowLength,
                            const std::vector<double>& yTrue) const;
    double meanSquaredError(const std::vector<double>& X,
                            int rowLength,
                            const std::vector<double>& yTrue,
                            int maxDepth) const;

    bool isFitted() const { return fitted_; }
    int getDepth() const { return config_.depth; }
    int getNumFeatures() const { return numFeatures_; }
    const CFMConfig& getConfig() const { return config_; }

    const std::vector<LinearModel>& getSubModels() const;
    const LinearModel& getSubModel(int depthIndex) const;

    /** 长度 depth+2，下标 1..depth 为训练时计算的偏移 */
    const std::vector<double>& getOffsets() const;

    /** 每层线性拟合在其目标上的训练 MSE */
    const std::vector<double>& getTrainingLoss() const { return trainingLoss_; }

    std::string name() const override { return "CFM"; }

private:
    CFMConfig config_;
    std::vector<LinearModel> subModels_;
    std::vector<double> offsets_;
    std::vector<double> trainingLoss_;
    int numFeatures_ = 0;
    bool fitted_ = false;

    void resetState();
    void checkFitted() const;
    int resolveMaxDepth(int maxDepth) const;
    void checkRowLength(int rowLength) const;

    /**
     * 自底向上展开连分式。
     * poleDepth 返回第一个非正分母所在的层（没有则为 -1），仅在 checkPoles 时记录。
     */
    double evaluateRow(const double* sample, int maxDepth,
                       bool checkPoles, int& poleDepth, double& poleValue) const;
};

#endif // CFM_MODEL_CONTINUEDFRACTIONMODEL_HPP
