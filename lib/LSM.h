#pragma once

#include <memory>
#include "InferenceMethod.h"
#include "Optimizer.h"

namespace spcode {

    struct LSMConfig {
        int    n_iter = 100;            ///< optimizer steps per reweighting pass
        int    n_iter_lsm = 6;          ///< reweighting passes
        double beta = 0.01;
        double alpha = 80.0;
        double sigma = 0.005;
        double sparse_threshold = 1e-2; ///< |a| below this is zeroed in the final solution
        double lr = 1e-3;               ///< Adam learning rate when no optimizer is given
        TrajectoryMode trajectory = TrajectoryMode::None;
    };

    /// Laplacian scale mixture inference (Garrigues & Olshausen 2010).
    ///
    /// Each outer pass sets lambda = (alpha + 1) / (beta + |A_prev|), restarts A from
    /// zero and minimizes LSMLoss with a fresh copy of the optimizer. The trajectory
    /// holds the starting point and the solution of every outer pass.
    class LSM : public InferenceMethod {
    public:
        explicit LSM(const LSMConfig& cfg = LSMConfig{});
        LSM(const LSMConfig& cfg, std::shared_ptr<const GradientOptimizer> optimizer);

        std::string name() const override { return "LSM"; }
        const LSMConfig& config() const { return cfg_; }

        /// Reweighting factors for the next pass
        Eigen::MatrixXd lambdas(const Eigen::MatrixXd& previous) const;

    protected:
        InferenceResult run(const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& data,
            const Eigen::MatrixXd* coeff0,
            const InferOptions& options) const override;

    private:
        LSMConfig cfg_;
        std::shared_ptr<const GradientOptimizer> optimizer_;
    };

} // namespace spcode
