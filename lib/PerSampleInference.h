#pragma once

#include <vector>
#include "InferenceMethod.h"

namespace spcode {

    /// Per-sample iteration record
    struct SampleTrace {
        std::vector<Eigen::RowVectorXd> coefficients;   ///< start, then one entry per step
        std::vector<double> residualNorms;              ///< ||y - a D^T|| at the same points
    };

    /// Base for solvers that treat every sample independently (IHT, MP, OMP).
    ///
    /// inferSample() only reads the dictionary, so it can be handed to any worker
    /// pool; run() spreads the batch over OpenMP threads. InferOptions::observer is
    /// not called by these solvers.
    class PerSampleInference : public InferenceMethod {
    public:
        /// @param y      one sample, 1 x n_features
        /// @param init   optional starting coefficients, 1 x n_basis
        /// @param trace  optional per-step record
        virtual Eigen::RowVectorXd inferSample(const Eigen::MatrixXd& dictionary,
            const Eigen::RowVectorXd& y,
            const Eigen::RowVectorXd* init = nullptr,
            SampleTrace* trace = nullptr,
            bool checkNan = false) const = 0;

        TrajectoryMode trajectoryMode() const { return trajectory_; }

    protected:
        explicit PerSampleInference(TrajectoryMode trajectory) : trajectory_(trajectory) {}

        /// Steps every sample performs for this dictionary
        virtual int stepCount(Eigen::Index nBasis) const = 0;

        InferenceResult run(const Eigen::MatrixXd& dictionary,
            const Eigen::MatrixXd& data,
            const Eigen::MatrixXd* coeff0,
            const InferOptions& options) const override;

        static void recordStep(SampleTrace* trace, const Eigen::RowVectorXd& coeff,
            const Eigen::RowVectorXd& residual);

    private:
        TrajectoryMode trajectory_;
    };

} // namespace spcode
