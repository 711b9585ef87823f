#include "PerSampleInference.h"
#include "Logger.h"

#include <exception>

namespace spcode {

    void PerSampleInference::recordStep(SampleTrace* trace, const Eigen::RowVectorXd& coeff,
        const Eigen::RowVectorXd& residual)
    {
        if (!trace) return;
        trace->coefficients.push_back(coeff);
        trace->residualNorms.push_back(residual.norm());
    }

    InferenceResult PerSampleInference::run(const Eigen::MatrixXd& dictionary,
        const Eigen::MatrixXd& data,
        const Eigen::MatrixXd* coeff0,
        const InferOptions& options) const
    {
        const Eigen::Index batchSize = data.rows();
        const Eigen::Index nBasis = dictionary.cols();
        const bool record = trajectory_ != TrajectoryMode::None;

        InferenceResult result;
        result.coefficients = Eigen::MatrixXd::Zero(batchSize, nBasis);
        result.iterations = stepCount(nBasis);

        std::vector<SampleTrace> traces(record ? static_cast<size_t>(batchSize) : 0);
        std::vector<std::exception_ptr> errors(static_cast<size_t>(batchSize));

        // samples only share the read-only dictionary; each writes its own row
#pragma omp parallel for schedule(dynamic)
        for (Eigen::Index i = 0; i < batchSize; ++i) {
            try {
                const Eigen::RowVectorXd y = data.row(i);
                Eigen::RowVectorXd init;
                if (coeff0) init = coeff0->row(i);
                SampleTrace* trace = record ? &traces[static_cast<size_t>(i)] : nullptr;
                result.coefficients.row(i) = inferSample(dictionary, y,
                    coeff0 ? &init : nullptr, trace, options.checkNan);
            }
            catch (...) {
                errors[static_cast<size_t>(i)] = std::current_exception();
            }
        }
        for (const auto& e : errors) {
            if (e) std::rethrow_exception(e);
        }

        if (record) {
            const size_t steps = static_cast<size_t>(result.iterations) + 1;
            result.trajectory.assign(steps, Eigen::MatrixXd::Zero(batchSize, nBasis));
            for (Eigen::Index i = 0; i < batchSize; ++i) {
                const auto& rows = traces[static_cast<size_t>(i)].coefficients;
                for (size_t t = 0; t < steps && t < rows.size(); ++t)
                    result.trajectory[t].row(i) = rows[t];
            }
        }

        Logger::debug("{}: batch={} basis={} steps={}", name(), batchSize, nBasis, result.iterations);
        return result;
    }

} // namespace spcode
