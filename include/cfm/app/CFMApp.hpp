// =============================================================================
// include/cfm/app/CFMApp.hpp
// =============================================================================
#ifndef CFM_APP_CFMAPP_HPP
#define CFM_APP_CFMAPP_HPP

#include "cfm/model/ContinuedFractionModel.hpp"
#include "boosting/trainer/GBRTTrainer.hpp"
#include <cstdint>
#include <memory>
#include <string>

/** 连分式回归应用程序参数 */
struct CFMOptions {
    // 数据参数
    std::string dataPath;
    double testRatio = 0.2;
    bool shuffle = true;
    uint32_t seed = 42;

    // CFM参数
    int depth = 3;
    double normalizationFactor = 1.0;
    std::string subModel = "ols";          // "ols" | "lasso" | "lasso:<alpha>"
    bool failOnPole = false;

    // 基线参数（0 表示不训练基线）
    int baselineIterations = 100;
    double baselineLearningRate = 0.1;
    int baselineMaxDepth = 4;

    // 输出
    std::string outputPath;
    bool verbose = true;
};

/** 运行连分式模型训练、逐层评估以及与 GBRT 基线的对比 */
void runCFMApp(const CFMOptions& options);

/** 由应用参数构建模型配置 */
CFMConfig makeCFMConfig(const CFMOptions& options);

/** 创建 GBRT 基线 */
std::unique_ptr<GBRTTrainer> createBaselineTrainer(const CFMOptions& options);

/** "propagate" -> false，"throw" -> true */
bool parsePoleMode(const std::string& mode);

/**
 * 解析命令行参数（按位置）：
 *   dataPath depth factor submodel testRatio baselineIterations outputPath poleMode shuffle seed
 * outputPath 为 "-" 表示不输出预测
 */
CFMOptions parseCFMCommandLine(int argc, char** argv);

#endif // CFM_APP_CFMAPP_HPP
