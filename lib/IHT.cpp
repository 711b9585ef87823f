#include "IHT.h"
#include "Thresholding.h"

namespace spcode {

    IHT::IHT(const IHTConfig& cfg)
        : PerSampleInference(cfg.trajectory), cfg_(cfg)
    {
        requireSparsityFraction(cfg_.sparsity);
        requireNonNegative(cfg_.n_iter, "IHT n_iter");
    }

    Eigen::RowVectorXd IHT::inferSample(const Eigen::MatrixXd& dictionary,
        const Eigen::RowVectorXd& y,
        const Eigen::RowVectorXd* init,
        SampleTrace* trace,
        bool checkNan) const
    {
        const Eigen::Index K = sparsityLevel(cfg_.sparsity, dictionary.cols());

        Eigen::RowVectorXd coeff = init ? *init : Eigen::RowVectorXd::Zero(dictionary.cols());
        Eigen::RowVectorXd residual = y - coeff * dictionary.transpose();
        recordStep(trace, coeff, residual);

        for (int t = 0; t < cfg_.n_iter; ++t) {
            const Eigen::RowVectorXd temp = coeff + residual * dictionary;
            coeff = keepLargest(temp, K);
            residual = y - coeff * dictionary.transpose();

            if (checkNan) InferenceMethod::checkNan(coeff, "coefficients");
            recordStep(trace, coeff, residual);
        }
        return coeff;
    }

} // namespace spcode
