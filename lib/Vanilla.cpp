#include "Vanilla.h"
#include "Logger.h"
#include "Thresholding.h"

#include <random>

namespace spcode {

    Vanilla::Vanilla(const VanillaConfig& cfg) : cfg_(cfg) {
        requireNonNegative(cfg_.n_iter, "Vanilla n_iter");
        requireNonNegative(cfg_.sparsity_penalty, "Vanilla sparsity_penalty");
        requireNonNegative(cfg_.epsilon, "Vanilla epsilon");
    }

    Eigen::MatrixXd Vanilla::gradientStep(const Eigen::MatrixXd& residual,
        const Eigen::MatrixXd& dictionary,
        const Eigen::MatrixXd& a) const
    {
        return residual * dictionary - cfg_.sparsity_penalty * signOf(a);
    }

    Eigen::MatrixXd Vanilla::initialize(Eigen::Index batchSize, Eigen::Index nBasis,
        const Eigen::MatrixXd* coeff0) const
    {
        if (coeff0) return *coeff0;
        std::mt19937 gen(cfg_.seed);
        std::uniform_real_distribution<double> dist(-0.5, 0.5);
        Eigen::MatrixXd a(batchSize, nBasis);
        for (Eigen::Index j = 0; j < nBasis; ++j)
            for (Eigen::Index i = 0; i < batchSize; ++i)
                a(i, j) = dist(gen);
        return a;
    }

    InferenceResult Vanilla::run(const Eigen::MatrixXd& dictionary,
        const Eigen::MatrixXd& data,
        const Eigen::MatrixXd* coeff0,
        const InferOptions& options) const
    {
        Eigen::MatrixXd a = initialize(data.rows(), dictionary.cols(), coeff0);
        Eigen::MatrixXd residual = data - a * dictionary.transpose();

        InferenceResult result;
        const bool record = cfg_.trajectory != TrajectoryMode::None;
        if (record) result.trajectory.reserve(static_cast<size_t>(cfg_.n_iter) + 1);

        Eigen::MatrixXd oldA;
        for (int i = 0; i < cfg_.n_iter; ++i) {
            if (record) result.trajectory.push_back(a);
            if (cfg_.stop_early) oldA = a;

            a += cfg_.coeff_lr * gradientStep(residual, dictionary, a);
            result.iterations = i + 1;

            if (options.checkNan) checkNan(a, "coefficients");
            if (options.observer) options.observer(i, a);

            if (cfg_.stop_early && (oldA - a).norm() / oldA.norm() < cfg_.epsilon) {
                Logger::debug("Vanilla stopped early after {} iterations", result.iterations);
                result.stoppedEarly = true;
                break;
            }
            residual = data - a * dictionary.transpose();
        }

        result.coefficients = a;
        if (record) result.trajectory.push_back(a);

        Logger::debug("Vanilla: batch={} basis={} iterations={}",
            data.rows(), dictionary.cols(), result.iterations);
        return result;
    }

} // namespace spcode
