#pragma once

#include <functional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "Errors.h"

namespace spcode {

    /// What to store per iteration when trajectory logging is on.
    /// RawState is the solver's pre-nonlinearity variable (LCA membrane potential,
    /// ISTA gradient-step output); solvers without a nonlinearity record coefficients
    /// for either non-None value.
    enum class TrajectoryMode {
        None,
        RawState,
        PostNonlinearity
    };

    /// "none" | "membrane" | "raw" | "active" | "activations"
    /// @throws InvalidConfigurationError on anything else
    TrajectoryMode parseTrajectoryMode(const std::string& s);
    std::string to_string(TrajectoryMode mode);

    /// (iteration index starting at 0, current batch coefficients)
    using IterationObserver = std::function<void(int, const Eigen::MatrixXd&)>;

    struct InferOptions {
        bool checkNan = false;          ///< run the NaN guard once per iteration
        IterationObserver observer;     ///< batch solvers only; empty = off
    };

    struct InferenceResult {
        Eigen::MatrixXd coefficients;              ///< n_samples x n_basis
        std::vector<Eigen::MatrixXd> trajectory;   ///< empty unless trajectory logging is on
        int  iterations = 0;
        bool stoppedEarly = false;
    };

    /// Shared contract of all inference solvers.
    ///
    /// A solver is immutable after construction: every piece of iteration state is
    /// local to one infer call, so one instance can serve concurrent callers.
    /// Dictionary is n_features x n_basis, data is n_samples x n_features.
    class InferenceMethod {
    public:
        virtual ~InferenceMethod() = default;

        /// Infer starting from the solver's default initial coefficients
        InferenceResult infer(const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& data,
            const InferOptions& options = InferOptions{}) const;

        /// Infer from caller-supplied coefficients (n_samples x n_basis)
        InferenceResult inferWarmStart(const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& data,
            const Eigen::MatrixXd& coeff0,
            const InferOptions& options = InferOptions{}) const;

        virtual std::string name() const = 0;

        /// @throws NumericInstabilityError naming @p label if any entry is NaN or inf
        template<typename Derived>
        static void checkNan(const Eigen::DenseBase<Derived>& data, const std::string& label) {
            if (!data.allFinite()) throwNonFinite(label);
        }

        static void checkShapes(const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& data,
            const Eigen::MatrixXd* coeff0);

    protected:
        /// Initial coefficients: the warm start if given, zeros otherwise
        virtual Eigen::MatrixXd initialize(Eigen::Index batchSize, Eigen::Index nBasis,
            const Eigen::MatrixXd* coeff0) const;

        virtual InferenceResult run(const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& data,
            const Eigen::MatrixXd* coeff0,
            const InferOptions& options) const = 0;

    private:
        [[noreturn]] static void throwNonFinite(const std::string& label);
    };

    /// Validation helpers shared by the solver constructors
    void requireNonNegative(int value, const char* what);
    void requirePositive(double value, const char* what);
    void requireNonNegative(double value, const char* what);

    /// @throws InvalidConfigurationError unless 0 < sparsity <= 1
    void requireSparsityFraction(double sparsity);

    /// K = ceil(sparsity * n_basis)
    Eigen::Index sparsityLevel(double sparsity, Eigen::Index nBasis);

} // namespace spcode
