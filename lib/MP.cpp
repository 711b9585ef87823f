#include "MP.h"

#include <cmath>

namespace spcode {

    Eigen::Index selectAtom(const Eigen::RowVectorXd& innerProducts,
        const Eigen::RowVectorXd& atomNorms,
        const std::vector<bool>* skip)
    {
        Eigen::Index best = -1;
        double bestScore = -1.0;
        for (Eigen::Index j = 0; j < innerProducts.size(); ++j) {
            if (!(atomNorms[j] > 0.0)) continue;
            if (skip && (*skip)[static_cast<size_t>(j)]) continue;
            const double score = std::abs(innerProducts[j]) / atomNorms[j];
            if (score > bestScore) {
                bestScore = score;
                best = j;
            }
        }
        return best;
    }

    MP::MP(const PursuitConfig& cfg)
        : PerSampleInference(cfg.trajectory), cfg_(cfg)
    {
        requireSparsityFraction(cfg_.sparsity);
    }

    int MP::stepCount(Eigen::Index nBasis) const {
        return static_cast<int>(sparsityLevel(cfg_.sparsity, nBasis));
    }

    Eigen::RowVectorXd MP::inferSample(const Eigen::MatrixXd& dictionary,
        const Eigen::RowVectorXd& y,
        const Eigen::RowVectorXd* init,
        SampleTrace* trace,
        bool checkNan) const
    {
        const int K = stepCount(dictionary.cols());
        // atoms need not be normalized
        const Eigen::RowVectorXd norms = dictionary.colwise().norm();

        Eigen::RowVectorXd coeff = init ? *init : Eigen::RowVectorXd::Zero(dictionary.cols());
        Eigen::RowVectorXd residual = y - coeff * dictionary.transpose();
        recordStep(trace, coeff, residual);

        for (int t = 0; t < K; ++t) {
            const Eigen::RowVectorXd dp = residual * dictionary;
            const Eigen::Index ind = selectAtom(dp, norms);
            if (ind >= 0) {
                coeff[ind] = dp[ind];
                residual -= dp[ind] * dictionary.col(ind).transpose();
            }

            if (checkNan) InferenceMethod::checkNan(coeff, "coefficients");
            recordStep(trace, coeff, residual);
        }
        return coeff;
    }

} // namespace spcode
