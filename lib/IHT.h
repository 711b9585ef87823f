#pragma once

#include "PerSampleInference.h"

namespace spcode {

    struct IHTConfig {
        double sparsity = 0.1;      ///< fraction of atoms kept, in (0, 1]
        int    n_iter = 10;
        TrajectoryMode trajectory = TrajectoryMode::None;
    };

    /// Iterative hard thresholding (Blumensath & Davies 2009).
    /// Every step: temp = a + (y - a D^T) D, then keep the K = ceil(sparsity * n_basis)
    /// largest |temp| and zero the rest.
    class IHT : public PerSampleInference {
    public:
        explicit IHT(const IHTConfig& cfg);

        std::string name() const override { return "IHT"; }
        const IHTConfig& config() const { return cfg_; }

        Eigen::RowVectorXd inferSample(const Eigen::MatrixXd& dictionary,
            const Eigen::RowVectorXd& y,
            const Eigen::RowVectorXd* init = nullptr,
            SampleTrace* trace = nullptr,
            bool checkNan = false) const override;

    protected:
        int stepCount(Eigen::Index) const override { return cfg_.n_iter; }

    private:
        IHTConfig cfg_;
    };

} // namespace spcode
