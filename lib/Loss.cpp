#include "Loss.h"
#include "Errors.h"
#include "Thresholding.h"

#include <string>
#include <utility>

namespace spcode {

    namespace {
        // X - A D^T
        Eigen::MatrixXd reconstructionResidual(const Eigen::MatrixXd& data,
            const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& coefficients)
        {
            return data - coefficients * dictionary.transpose();
        }
    }

    ReconstructionL1Loss::ReconstructionL1Loss(double sparsityPenalty)
        : lambda_(sparsityPenalty)
    {
        if (lambda_ < 0.0)
            throw InvalidConfigurationError("sparsity penalty must be >= 0, got " + std::to_string(lambda_));
    }

    Eigen::VectorXd ReconstructionL1Loss::value(const Eigen::MatrixXd& data,
        const Eigen::MatrixXd& dictionary,
        const Eigen::MatrixXd& coefficients) const
    {
        const Eigen::MatrixXd r = reconstructionResidual(data, dictionary, coefficients);
        return 0.5 * r.rowwise().squaredNorm()
            + lambda_ * coefficients.cwiseAbs().rowwise().sum();
    }

    Eigen::MatrixXd ReconstructionL1Loss::gradient(const Eigen::MatrixXd& data,
        const Eigen::MatrixXd& dictionary,
        const Eigen::MatrixXd& coefficients) const
    {
        const Eigen::MatrixXd r = reconstructionResidual(data, dictionary, coefficients);
        return -(r * dictionary) + lambda_ * signOf(coefficients);
    }

    LSMLoss::LSMLoss(Eigen::MatrixXd lambdas, double sigma)
        : lambdas_(std::move(lambdas)), sigma_(sigma)
    {
        if (!(sigma_ > 0.0))
            throw InvalidConfigurationError("LSM sigma must be > 0, got " + std::to_string(sigma_));
    }

    Eigen::VectorXd LSMLoss::value(const Eigen::MatrixXd& data,
        const Eigen::MatrixXd& dictionary,
        const Eigen::MatrixXd& coefficients) const
    {
        const Eigen::MatrixXd r = reconstructionResidual(data, dictionary, coefficients);
        const double scale = 1.0 / (2.0 * sigma_ * sigma_);
        return scale * r.rowwise().squaredNorm()
            + lambdas_.cwiseProduct(coefficients.cwiseAbs()).rowwise().sum();
    }

    Eigen::MatrixXd LSMLoss::gradient(const Eigen::MatrixXd& data,
        const Eigen::MatrixXd& dictionary,
        const Eigen::MatrixXd& coefficients) const
    {
        const Eigen::MatrixXd r = reconstructionResidual(data, dictionary, coefficients);
        return -(r * dictionary) / (sigma_ * sigma_)
            + lambdas_.cwiseProduct(signOf(coefficients));
    }

    FunctionLoss::FunctionLoss(ValueFn value, GradientFn gradient)
        : value_(std::move(value)), gradient_(std::move(gradient))
    {
        if (!value_ || !gradient_)
            throw InvalidConfigurationError("FunctionLoss needs both a value and a gradient function");
    }

    Eigen::VectorXd FunctionLoss::value(const Eigen::MatrixXd& data,
        const Eigen::MatrixXd& dictionary,
        const Eigen::MatrixXd& coefficients) const
    {
        return value_(data, dictionary, coefficients);
    }

    Eigen::MatrixXd FunctionLoss::gradient(const Eigen::MatrixXd& data,
        const Eigen::MatrixXd& dictionary,
        const Eigen::MatrixXd& coefficients) const
    {
        return gradient_(data, dictionary, coefficients);
    }

} // namespace spcode
