#pragma once

#include <memory>
#include "InferenceMethod.h"
#include "Loss.h"
#include "Optimizer.h"

namespace spcode {

    struct GenericOptimizerConfig {
        int n_iter = 100;
        TrajectoryMode trajectory = TrajectoryMode::None;
    };

    /// Runs exactly n_iter steps of an injected optimizer on an injected loss.
    /// No convergence test. The optimizer is a prototype: every call works on a clone,
    /// so results depend only on the prototype's state at construction.
    class GenericOptimizerSolver : public InferenceMethod {
    public:
        GenericOptimizerSolver(std::shared_ptr<const DifferentiableLoss> loss,
            std::shared_ptr<const GradientOptimizer> optimizer,
            const GenericOptimizerConfig& cfg = GenericOptimizerConfig{});

        std::string name() const override { return "GenericOptimizer"; }
        const GenericOptimizerConfig& config() const { return cfg_; }
        const DifferentiableLoss& loss() const { return *loss_; }

    protected:
        InferenceResult run(const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& data,
            const Eigen::MatrixXd* coeff0,
            const InferOptions& options) const override;

    private:
        std::shared_ptr<const DifferentiableLoss> loss_;
        std::shared_ptr<const GradientOptimizer> optimizer_;
        GenericOptimizerConfig cfg_;
    };

} // namespace spcode
