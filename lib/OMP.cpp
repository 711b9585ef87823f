#include "OMP.h"

#include <vector>
#include <Eigen/QR>

namespace spcode {

    namespace {
        // min-norm least squares of y ~ coeff_active * D_active^T, written into coeff
        void refit(const Eigen::MatrixXd& dictionary,
            const Eigen::RowVectorXd& y,
            const std::vector<Eigen::Index>& active,
            Eigen::RowVectorXd& coeff)
        {
            Eigen::MatrixXd sub(dictionary.rows(), static_cast<Eigen::Index>(active.size()));
            for (size_t k = 0; k < active.size(); ++k)
                sub.col(static_cast<Eigen::Index>(k)) = dictionary.col(active[k]);

            const Eigen::CompleteOrthogonalDecomposition<Eigen::MatrixXd> cod(sub);
            const Eigen::VectorXd x = cod.solve(y.transpose());

            coeff.setZero();
            for (size_t k = 0; k < active.size(); ++k)
                coeff[active[k]] = x[static_cast<Eigen::Index>(k)];
        }
    }

    OMP::OMP(const PursuitConfig& cfg)
        : PerSampleInference(cfg.trajectory), cfg_(cfg)
    {
        requireSparsityFraction(cfg_.sparsity);
    }

    int OMP::stepCount(Eigen::Index nBasis) const {
        return static_cast<int>(sparsityLevel(cfg_.sparsity, nBasis));
    }

    Eigen::RowVectorXd OMP::inferSample(const Eigen::MatrixXd& dictionary,
        const Eigen::RowVectorXd& y,
        const Eigen::RowVectorXd* init,
        SampleTrace* trace,
        bool checkNan) const
    {
        const Eigen::Index nBasis = dictionary.cols();
        const int K = stepCount(nBasis);
        const Eigen::RowVectorXd norms = dictionary.colwise().norm();

        std::vector<Eigen::Index> active;
        std::vector<bool> selected(static_cast<size_t>(nBasis), false);
        Eigen::RowVectorXd coeff = Eigen::RowVectorXd::Zero(nBasis);

        if (init) {
            for (Eigen::Index j = 0; j < nBasis; ++j) {
                if ((*init)[j] != 0.0) {
                    active.push_back(j);
                    selected[static_cast<size_t>(j)] = true;
                }
            }
            if (!active.empty()) refit(dictionary, y, active, coeff);
        }
        Eigen::RowVectorXd residual = y - coeff * dictionary.transpose();
        recordStep(trace, coeff, residual);

        for (int t = 0; t < K; ++t) {
            const Eigen::RowVectorXd dp = residual * dictionary;
            const Eigen::Index ind = selectAtom(dp, norms, &selected);
            if (ind >= 0) {
                active.push_back(ind);
                selected[static_cast<size_t>(ind)] = true;
                refit(dictionary, y, active, coeff);
                residual = y - coeff * dictionary.transpose();
            }

            if (checkNan) InferenceMethod::checkNan(coeff, "coefficients");
            recordStep(trace, coeff, residual);
        }
        return coeff;
    }

} // namespace spcode
