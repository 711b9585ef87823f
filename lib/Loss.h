#pragma once

#include <functional>
#include <Eigen/Dense>

namespace spcode {

    /// Differentiable loss over a batch of coefficients.
    ///
    /// value() returns one scalar per sample; gradient() is the gradient of the summed
    /// loss with respect to the coefficients (n_samples x n_basis). Only the fixed
    /// quadratic + L1 forms are implemented analytically; the L1 subgradient at 0 is 0.
    class DifferentiableLoss {
    public:
        virtual ~DifferentiableLoss() = default;

        virtual Eigen::VectorXd value(const Eigen::MatrixXd& data,
            const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& coefficients) const = 0;

        virtual Eigen::MatrixXd gradient(const Eigen::MatrixXd& data,
            const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& coefficients) const = 0;
    };

    /// 1/2 ||x - D a||^2 + lambda ||a||_1 per sample
    class ReconstructionL1Loss : public DifferentiableLoss {
    public:
        explicit ReconstructionL1Loss(double sparsityPenalty = 0.0);

        Eigen::VectorXd value(const Eigen::MatrixXd& data,
            const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& coefficients) const override;

        Eigen::MatrixXd gradient(const Eigen::MatrixXd& data,
            const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& coefficients) const override;

    private:
        double lambda_;
    };

    /// Laplacian scale mixture energy, eq. (7) of Garrigues & Olshausen (2010):
    /// 1/(2 sigma^2) ||x - D a||^2 + sum_j lambda_j |a_j|, with per-coefficient lambdas
    class LSMLoss : public DifferentiableLoss {
    public:
        /// @param lambdas n_samples x n_basis reweighting factors
        LSMLoss(Eigen::MatrixXd lambdas, double sigma);

        Eigen::VectorXd value(const Eigen::MatrixXd& data,
            const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& coefficients) const override;

        Eigen::MatrixXd gradient(const Eigen::MatrixXd& data,
            const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& coefficients) const override;

        const Eigen::MatrixXd& lambdas() const { return lambdas_; }

    private:
        Eigen::MatrixXd lambdas_;
        double sigma_;
    };

    /// Caller-supplied loss given as a value function and its gradient
    class FunctionLoss : public DifferentiableLoss {
    public:
        using ValueFn = std::function<Eigen::VectorXd(const Eigen::MatrixXd&,
            const Eigen::MatrixXd&, const Eigen::MatrixXd&)>;
        using GradientFn = std::function<Eigen::MatrixXd(const Eigen::MatrixXd&,
            const Eigen::MatrixXd&, const Eigen::MatrixXd&)>;

        FunctionLoss(ValueFn value, GradientFn gradient);

        Eigen::VectorXd value(const Eigen::MatrixXd& data,
            const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& coefficients) const override;

        Eigen::MatrixXd gradient(const Eigen::MatrixXd& data,
            const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& coefficients) const override;

    private:
        ValueFn value_;
        GradientFn gradient_;
    };

} // namespace spcode
