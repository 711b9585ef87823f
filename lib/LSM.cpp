#include "LSM.h"
#include "Logger.h"
#include "Loss.h"

#include <utility>

namespace spcode {

    LSM::LSM(const LSMConfig& cfg)
        : LSM(cfg, std::make_shared<Adam>(AdamConfig{ cfg.lr }))
    {}

    LSM::LSM(const LSMConfig& cfg, std::shared_ptr<const GradientOptimizer> optimizer)
        : cfg_(cfg), optimizer_(std::move(optimizer))
    {
        requireNonNegative(cfg_.n_iter, "LSM n_iter");
        requireNonNegative(cfg_.n_iter_lsm, "LSM n_iter_lsm");
        requirePositive(cfg_.sigma, "LSM sigma");
        requirePositive(cfg_.beta, "LSM beta");
        requireNonNegative(cfg_.sparse_threshold, "LSM sparse_threshold");
        if (!optimizer_)
            throw InvalidConfigurationError("LSM needs an optimizer");
    }

    Eigen::MatrixXd LSM::lambdas(const Eigen::MatrixXd& previous) const {
        return ((cfg_.alpha + 1.0) / (cfg_.beta + previous.array().abs())).matrix();
    }

    InferenceResult LSM::run(const Eigen::MatrixXd& dictionary,
        const Eigen::MatrixXd& data,
        const Eigen::MatrixXd* coeff0,
        const InferOptions& options) const
    {
        const Eigen::Index batchSize = data.rows();
        const Eigen::Index nBasis = dictionary.cols();

        Eigen::MatrixXd coefficients = initialize(batchSize, nBasis, coeff0);

        InferenceResult result;
        const bool record = cfg_.trajectory != TrajectoryMode::None;
        if (record) {
            result.trajectory.reserve(static_cast<size_t>(cfg_.n_iter_lsm) + 1);
            result.trajectory.push_back(coefficients);
        }

        for (int pass = 0; pass < cfg_.n_iter_lsm; ++pass) {
            const LSMLoss loss(lambdas(coefficients), cfg_.sigma);

            coefficients.setZero(batchSize, nBasis);
            std::unique_ptr<GradientOptimizer> optimizer = optimizer_->clone();
            optimizer->reset();

            for (int t = 0; t < cfg_.n_iter; ++t) {
                optimizer->step(coefficients, loss.gradient(data, dictionary, coefficients));
                if (options.checkNan) checkNan(coefficients, "coefficients");
            }
            result.iterations = pass + 1;

            if (options.observer) options.observer(pass, coefficients);
            if (record) result.trajectory.push_back(coefficients);
        }

        // sparsify the final solution
        coefficients = (coefficients.array().abs() < cfg_.sparse_threshold)
            .select(0.0, coefficients.array()).matrix();
        result.coefficients = coefficients;
        if (record) result.trajectory.back() = coefficients;

        Logger::debug("LSM: batch={} basis={} passes={} inner_steps={}",
            batchSize, nBasis, result.iterations, cfg_.n_iter);
        return result;
    }

} // namespace spcode
