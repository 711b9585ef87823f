#include "GenericOptimizerSolver.h"
#include "Logger.h"

#include <utility>

namespace spcode {

    GenericOptimizerSolver::GenericOptimizerSolver(std::shared_ptr<const DifferentiableLoss> loss,
        std::shared_ptr<const GradientOptimizer> optimizer,
        const GenericOptimizerConfig& cfg)
        : loss_(std::move(loss)), optimizer_(std::move(optimizer)), cfg_(cfg)
    {
        requireNonNegative(cfg_.n_iter, "optimizer n_iter");
        if (!loss_) throw InvalidConfigurationError("GenericOptimizerSolver needs a loss");
        if (!optimizer_) throw InvalidConfigurationError("GenericOptimizerSolver needs an optimizer");
    }

    InferenceResult GenericOptimizerSolver::run(const Eigen::MatrixXd& dictionary,
        const Eigen::MatrixXd& data,
        const Eigen::MatrixXd* coeff0,
        const InferOptions& options) const
    {
        Eigen::MatrixXd coefficients = initialize(data.rows(), dictionary.cols(), coeff0);
        std::unique_ptr<GradientOptimizer> optimizer = optimizer_->clone();

        InferenceResult result;
        const bool record = cfg_.trajectory != TrajectoryMode::None;
        if (record) result.trajectory.reserve(static_cast<size_t>(cfg_.n_iter) + 1);

        for (int i = 0; i < cfg_.n_iter; ++i) {
            if (record) result.trajectory.push_back(coefficients);

            const Eigen::MatrixXd grad = loss_->gradient(data, dictionary, coefficients);
            if (grad.rows() != coefficients.rows() || grad.cols() != coefficients.cols())
                throw ShapeMismatchError("loss gradient shape does not match the coefficients");
            optimizer->step(coefficients, grad);
            result.iterations = i + 1;

            if (options.checkNan) checkNan(coefficients, "coefficients");
            if (options.observer) options.observer(i, coefficients);
        }

        result.coefficients = coefficients;
        if (record) result.trajectory.push_back(coefficients);

        Logger::debug("GenericOptimizer: batch={} basis={} steps={}",
            data.rows(), dictionary.cols(), result.iterations);
        return result;
    }

} // namespace spcode
