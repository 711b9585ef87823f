#pragma once

#include <cstdint>
#include "InferenceMethod.h"

namespace spcode {

    struct VanillaConfig {
        int    n_iter = 100;
        double coeff_lr = 1e-3;
        double sparsity_penalty = 0.2;
        bool   stop_early = false;
        double epsilon = 1e-2;
        TrajectoryMode trajectory = TrajectoryMode::None;
        std::uint32_t seed = 0;     ///< seeds the random initial coefficients
    };

    /// Gradient descent (Euler steps) on the Olshausen & Field (1997) energy with a
    /// Laplace prior: 1/2 ||x - D a||^2 + lambda ||a||_1.
    class Vanilla : public InferenceMethod {
    public:
        explicit Vanilla(const VanillaConfig& cfg = VanillaConfig{});

        std::string name() const override { return "Vanilla"; }
        const VanillaConfig& config() const { return cfg_; }

        /// da = r D - lambda * sign(a), with r = X - a D^T
        Eigen::MatrixXd gradientStep(const Eigen::MatrixXd& residual,
            const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& a) const;

    protected:
        /// Uniform in [-0.5, 0.5) unless a warm start is given
        Eigen::MatrixXd initialize(Eigen::Index batchSize, Eigen::Index nBasis,
            const Eigen::MatrixXd* coeff0) const override;

        InferenceResult run(const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& data,
            const Eigen::MatrixXd* coeff0,
            const InferOptions& options) const override;

    private:
        VanillaConfig cfg_;
    };

} // namespace spcode
