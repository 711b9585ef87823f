#include "InferenceMethod.h"
#include "Logger.h"

#include <algorithm>
#include <cmath>

namespace spcode {

    TrajectoryMode parseTrajectoryMode(const std::string& s) {
        if (s == "none") return TrajectoryMode::None;
        if (s == "membrane" || s == "raw") return TrajectoryMode::RawState;
        if (s == "active" || s == "activations") return TrajectoryMode::PostNonlinearity;
        throw InvalidConfigurationError(
            "Invalid trajectory mode '" + s +
            "'. Valid inputs are: 'none', 'membrane', 'active'.");
    }

    std::string to_string(TrajectoryMode mode) {
        switch (mode) {
        case TrajectoryMode::RawState:         return "membrane";
        case TrajectoryMode::PostNonlinearity: return "active";
        case TrajectoryMode::None:             break;
        }
        return "none";
    }

    InferenceResult InferenceMethod::infer(const Eigen::MatrixXd& dictionary,
        const Eigen::MatrixXd& data,
        const InferOptions& options) const
    {
        checkShapes(dictionary, data, nullptr);
        return run(dictionary, data, nullptr, options);
    }

    InferenceResult InferenceMethod::inferWarmStart(const Eigen::MatrixXd& dictionary,
        const Eigen::MatrixXd& data,
        const Eigen::MatrixXd& coeff0,
        const InferOptions& options) const
    {
        checkShapes(dictionary, data, &coeff0);
        return run(dictionary, data, &coeff0, options);
    }

    void InferenceMethod::checkShapes(const Eigen::MatrixXd& dictionary,
        const Eigen::MatrixXd& data,
        const Eigen::MatrixXd* coeff0)
    {
        if (dictionary.rows() != data.cols()) {
            throw ShapeMismatchError(
                "dictionary has " + std::to_string(dictionary.rows()) +
                " features but data has " + std::to_string(data.cols()));
        }
        if (coeff0 && (coeff0->rows() != data.rows() || coeff0->cols() != dictionary.cols())) {
            throw ShapeMismatchError(
                "initial coefficients are " + std::to_string(coeff0->rows()) + "x" +
                std::to_string(coeff0->cols()) + ", expected " +
                std::to_string(data.rows()) + "x" + std::to_string(dictionary.cols()));
        }
    }

    Eigen::MatrixXd InferenceMethod::initialize(Eigen::Index batchSize, Eigen::Index nBasis,
        const Eigen::MatrixXd* coeff0) const
    {
        if (coeff0) return *coeff0;
        return Eigen::MatrixXd::Zero(batchSize, nBasis);
    }

    void InferenceMethod::throwNonFinite(const std::string& label) {
        Logger::error("InferenceMethod error: non-finite value in " + label);
        throw NumericInstabilityError("InferenceMethod error: non-finite value in " + label + ".");
    }

    void requireNonNegative(int value, const char* what) {
        if (value < 0)
            throw InvalidConfigurationError(std::string(what) + " must be >= 0, got " + std::to_string(value));
    }

    void requirePositive(double value, const char* what) {
        if (!(value > 0.0))
            throw InvalidConfigurationError(std::string(what) + " must be > 0, got " + std::to_string(value));
    }

    void requireNonNegative(double value, const char* what) {
        if (!(value >= 0.0))
            throw InvalidConfigurationError(std::string(what) + " must be >= 0, got " + std::to_string(value));
    }

    void requireSparsityFraction(double sparsity) {
        if (!(sparsity > 0.0 && sparsity <= 1.0))
            throw InvalidConfigurationError(
                "sparsity must be in (0, 1], got " + std::to_string(sparsity));
    }

    Eigen::Index sparsityLevel(double sparsity, Eigen::Index nBasis) {
        const double k = std::ceil(sparsity * static_cast<double>(nBasis));
        return std::min<Eigen::Index>(nBasis, std::max<Eigen::Index>(1, static_cast<Eigen::Index>(k)));
    }

} // namespace spcode
