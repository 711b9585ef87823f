#include "ISTA.h"
#include "Logger.h"
#include "Thresholding.h"

#include <cmath>
#include <string>

#include <Eigen/Eigenvalues>

namespace spcode {

    ISTA::ISTA(const ISTAConfig& cfg) : cfg_(cfg) {
        requireNonNegative(cfg_.n_iter, "ISTA n_iter");
        requireNonNegative(cfg_.sparsity_penalty, "ISTA sparsity_penalty");
        requireNonNegative(cfg_.epsilon, "ISTA epsilon");
    }

    double ISTA::lipschitzConstant(const Eigen::MatrixXd& dictionary) {
        const Eigen::MatrixXd DtD = dictionary.transpose() * dictionary;
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(DtD, Eigen::EigenvaluesOnly);
        if (es.info() != Eigen::Success)
            throw NumericInstabilityError("ISTA: eigen-decomposition of D^T D failed");
        // eigenvalues come sorted in increasing order
        return es.eigenvalues()(es.eigenvalues().size() - 1);
    }

    double ISTA::stepSize(const Eigen::MatrixXd& dictionary) {
        const double L = lipschitzConstant(dictionary);
        if (!(L > 0.0) || !std::isfinite(L))
            throw NumericInstabilityError(
                "ISTA: Lipschitz constant must be positive, got " + std::to_string(L));
        return 1.0 / L;
    }

    double ISTA::threshold(const Eigen::MatrixXd& dictionary) const {
        return stepSize(dictionary) * cfg_.sparsity_penalty;
    }

    Eigen::MatrixXd ISTA::gradientStep(const Eigen::MatrixXd& u,
        const Eigen::MatrixXd& residual,
        const Eigen::MatrixXd& dictionary,
        double stepsize) const
    {
        return u - stepsize * (residual * dictionary);
    }

    InferenceResult ISTA::run(const Eigen::MatrixXd& dictionary,
        const Eigen::MatrixXd& data,
        const Eigen::MatrixXd* coeff0,
        const InferOptions& options) const
    {
        if (dictionary.cols() == 0)
            throw ShapeMismatchError("ISTA: dictionary has no atoms");

        const double stepsize = stepSize(dictionary);
        const double theta = stepsize * cfg_.sparsity_penalty;

        // base is where the next gradient step starts: the warm start first, then the
        // thresholded coefficients. u keeps the latest pre-threshold iterate.
        Eigen::MatrixXd base = initialize(data.rows(), dictionary.cols(), coeff0);
        Eigen::MatrixXd u = base;
        Eigen::MatrixXd A = softThreshold(u, theta);
        Eigen::MatrixXd residual = A * dictionary.transpose() - data;

        InferenceResult result;
        const bool record = cfg_.trajectory != TrajectoryMode::None;
        const bool recordRaw = cfg_.trajectory == TrajectoryMode::RawState;
        if (record) result.trajectory.reserve(static_cast<size_t>(cfg_.n_iter) + 1);

        for (int i = 0; i < cfg_.n_iter; ++i) {
            if (record) result.trajectory.push_back(recordRaw ? u : A);

            u = gradientStep(base, residual, dictionary, stepsize);
            A = softThreshold(u, theta);
            result.iterations = i + 1;

            if (options.checkNan) checkNan(A, "coefficients");
            if (options.observer) options.observer(i, A);

            if (cfg_.stop_early && u.size() > 0 && (base - u).cwiseAbs().mean() / stepsize < cfg_.epsilon) {
                Logger::debug("ISTA stopped early after {} iterations", result.iterations);
                result.stoppedEarly = true;
                break;
            }
            residual = A * dictionary.transpose() - data;
            base = A;
        }

        result.coefficients = recordRaw ? u : A;
        if (record) result.trajectory.push_back(result.coefficients);

        Logger::debug("ISTA: batch={} basis={} stepsize={} threshold={} iterations={}",
            data.rows(), dictionary.cols(), stepsize, theta, result.iterations);
        return result;
    }

} // namespace spcode
