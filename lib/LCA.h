#pragma once

#include "InferenceMethod.h"

namespace spcode {

    struct LCAConfig {
        int    n_iter = 100;
        double coeff_lr = 1e-3;     ///< Euler step on the membrane dynamics
        double threshold = 0.1;     ///< soft threshold on u
        bool   stop_early = false;
        double epsilon = 1e-2;      ///< relative change of u that stops the dynamics
        TrajectoryMode trajectory = TrajectoryMode::None;
    };

    /// Locally competitive algorithm (Rozell et al. 2008) with the ideal soft threshold.
    ///
    ///   b  = X D
    ///   G  = D^T D - I
    ///   du = b - u - a G,  a = T_theta(u)
    ///   u <- u + eta * du
    ///
    /// Trajectory RawState records membrane potentials u, PostNonlinearity records
    /// the thresholded activations a. In RawState mode the returned coefficients are
    /// the final membrane potentials as well.
    class LCA : public InferenceMethod {
    public:
        explicit LCA(const LCAConfig& cfg = LCAConfig{});

        std::string name() const override { return "LCA"; }
        const LCAConfig& config() const { return cfg_; }

        Eigen::MatrixXd thresholdNonlinearity(const Eigen::MatrixXd& u) const;

        /// du for the current potentials u and activations a
        Eigen::MatrixXd gradientStep(const Eigen::MatrixXd& b,
            const Eigen::MatrixXd& G,
            const Eigen::MatrixXd& u,
            const Eigen::MatrixXd& a) const;

    protected:
        InferenceResult run(const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& data,
            const Eigen::MatrixXd* coeff0,
            const InferOptions& options) const override;

    private:
        LCAConfig cfg_;
    };

} // namespace spcode
