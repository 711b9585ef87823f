#pragma once

#include <memory>
#include <Eigen/Dense>

namespace spcode {

    /// First-order optimizer over one coefficient matrix.
    ///
    /// step() consumes an externally computed gradient and updates the parameters in
    /// place. Optimizers carry state (momenta); solvers clone a prototype per call.
    class GradientOptimizer {
    public:
        virtual ~GradientOptimizer() = default;

        virtual void step(Eigen::MatrixXd& parameters, const Eigen::MatrixXd& gradient) = 0;
        virtual void reset() = 0;
        virtual std::unique_ptr<GradientOptimizer> clone() const = 0;
    };

    struct SGDConfig {
        double lr = 1e-2;
        double momentum = 0.0;
    };

    class SGD : public GradientOptimizer {
    public:
        explicit SGD(const SGDConfig& cfg = SGDConfig{});

        void step(Eigen::MatrixXd& parameters, const Eigen::MatrixXd& gradient) override;
        void reset() override;
        std::unique_ptr<GradientOptimizer> clone() const override;

    private:
        SGDConfig cfg_;
        Eigen::MatrixXd velocity_;
    };

    struct AdamConfig {
        double lr = 1e-3;
        double beta1 = 0.9;
        double beta2 = 0.999;
        double eps = 1e-8;
    };

    /// Adam (Kingma & Ba 2015) with bias correction
    class Adam : public GradientOptimizer {
    public:
        explicit Adam(const AdamConfig& cfg = AdamConfig{});

        void step(Eigen::MatrixXd& parameters, const Eigen::MatrixXd& gradient) override;
        void reset() override;
        std::unique_ptr<GradientOptimizer> clone() const override;

        int timestep() const { return t_; }

    private:
        AdamConfig cfg_;
        Eigen::MatrixXd m_;
        Eigen::MatrixXd v_;
        int t_ = 0;
    };

} // namespace spcode
