#include "LCA.h"
#include "Logger.h"
#include "Thresholding.h"

namespace spcode {

    LCA::LCA(const LCAConfig& cfg) : cfg_(cfg) {
        requireNonNegative(cfg_.n_iter, "LCA n_iter");
        requireNonNegative(cfg_.threshold, "LCA threshold");
        requireNonNegative(cfg_.epsilon, "LCA epsilon");
    }

    Eigen::MatrixXd LCA::thresholdNonlinearity(const Eigen::MatrixXd& u) const {
        return softThreshold(u, cfg_.threshold);
    }

    Eigen::MatrixXd LCA::gradientStep(const Eigen::MatrixXd& b,
        const Eigen::MatrixXd& G,
        const Eigen::MatrixXd& u,
        const Eigen::MatrixXd& a) const
    {
        // (G a^T)^T == a G since G is symmetric
        return b - u - a * G;
    }

    InferenceResult LCA::run(const Eigen::MatrixXd& dictionary,
        const Eigen::MatrixXd& data,
        const Eigen::MatrixXd* coeff0,
        const InferOptions& options) const
    {
        const Eigen::Index batchSize = data.rows();
        const Eigen::Index nBasis = dictionary.cols();

        Eigen::MatrixXd u = initialize(batchSize, nBasis, coeff0);
        const Eigen::MatrixXd b = data * dictionary;
        const Eigen::MatrixXd G = dictionary.transpose() * dictionary
            - Eigen::MatrixXd::Identity(nBasis, nBasis);

        InferenceResult result;
        const bool record = cfg_.trajectory != TrajectoryMode::None;
        if (record) result.trajectory.reserve(static_cast<size_t>(cfg_.n_iter) + 1);

        Eigen::MatrixXd oldU;
        for (int i = 0; i < cfg_.n_iter; ++i) {
            if (cfg_.stop_early) oldU = u;

            if (cfg_.trajectory == TrajectoryMode::PostNonlinearity)
                result.trajectory.push_back(thresholdNonlinearity(u));
            else if (cfg_.trajectory == TrajectoryMode::RawState)
                result.trajectory.push_back(u);

            const Eigen::MatrixXd a = thresholdNonlinearity(u);
            u += cfg_.coeff_lr * gradientStep(b, G, u, a);
            result.iterations = i + 1;

            if (options.checkNan) checkNan(u, "coefficients");
            if (options.observer) options.observer(i, u);

            if (cfg_.stop_early && (oldU - u).norm() / oldU.norm() < cfg_.epsilon) {
                Logger::debug("LCA stopped early after {} iterations", result.iterations);
                result.stoppedEarly = true;
                break;
            }
        }

        result.coefficients = (cfg_.trajectory == TrajectoryMode::RawState)
            ? u : thresholdNonlinearity(u);
        if (record) result.trajectory.push_back(result.coefficients);

        Logger::debug("LCA: batch={} basis={} iterations={}", batchSize, nBasis, result.iterations);
        return result;
    }

} // namespace spcode
