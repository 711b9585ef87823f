#pragma once

#include "InferenceMethod.h"

namespace spcode {

    struct ISTAConfig {
        int    n_iter = 100;
        double sparsity_penalty = 1e-2;
        bool   stop_early = false;
        double epsilon = 1e-2;
        TrajectoryMode trajectory = TrajectoryMode::None;
    };

    /// Iterative shrinkage-thresholding (Beck & Teboulle 2009, eq. 1.4/1.5).
    ///
    /// The step size is 1/L with L = lambda_max(D^T D), which keeps the objective
    /// monotonically decreasing; the shrinkage threshold is stepsize * lambda.
    class ISTA : public InferenceMethod {
    public:
        explicit ISTA(const ISTAConfig& cfg = ISTAConfig{});

        std::string name() const override { return "ISTA"; }
        const ISTAConfig& config() const { return cfg_; }

        /// Largest eigenvalue of D^T D
        static double lipschitzConstant(const Eigen::MatrixXd& dictionary);

        /// 1 / lipschitzConstant(D)
        /// @throws NumericInstabilityError when D^T D has no positive eigenvalue
        static double stepSize(const Eigen::MatrixXd& dictionary);

        /// stepSize(D) * sparsity_penalty
        double threshold(const Eigen::MatrixXd& dictionary) const;

        /// u - stepsize * R D, with R = A D^T - X
        Eigen::MatrixXd gradientStep(const Eigen::MatrixXd& u,
            const Eigen::MatrixXd& residual,
            const Eigen::MatrixXd& dictionary,
            double stepsize) const;

    protected:
        InferenceResult run(const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& data,
            const Eigen::MatrixXd* coeff0,
            const InferOptions& options) const override;

    private:
        ISTAConfig cfg_;
    };

} // namespace spcode
