#include "linear/ILinearSolver.hpp"
#include "linear/OLSSolver.hpp"
#include "linear/LassoSolver.hpp"
#include "cfm/core/CFMConfig.hpp"
#include <memory>

std::unique_ptr<ILinearSolver> createLinearSolver(const CFMConfig& config) {
    switch (config.subModelType) {
    case SubModelType::L1Regularized:
        return std::make_unique<LassoSolver>(config.l1Alpha,
                                             config.l1MaxIterations,
                                             config.l1Tolerance,
                                             config.fitIntercept);
    case SubModelType::OrdinaryLeastSquares:
        break;
    }
    return std::make_unique<OLSSolver>(config.fitIntercept);
}
