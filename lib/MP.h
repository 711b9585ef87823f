#pragma once

#include <vector>
#include "PerSampleInference.h"

namespace spcode {

    struct PursuitConfig {
        double sparsity = 0.1;      ///< K = ceil(sparsity * n_basis) greedy steps
        TrajectoryMode trajectory = TrajectoryMode::None;
    };

    /// Index of the atom with the largest |dp_j| / ||d_j||.
    /// Zero-norm atoms and atoms flagged in @p skip are never chosen; returns -1 when
    /// nothing is selectable. Ties go to the lower index.
    Eigen::Index selectAtom(const Eigen::RowVectorXd& innerProducts,
        const Eigen::RowVectorXd& atomNorms,
        const std::vector<bool>* skip = nullptr);

    /// Matching pursuit (Mallat & Zhang 1993).
    /// Each of the K steps assigns the raw inner product of the chosen atom as its
    /// coefficient and explains it away from the residual. Repeats are not forbidden;
    /// a reselected atom gets the new inner product, not the sum.
    class MP : public PerSampleInference {
    public:
        explicit MP(const PursuitConfig& cfg);

        std::string name() const override { return "MP"; }
        const PursuitConfig& config() const { return cfg_; }

        Eigen::RowVectorXd inferSample(const Eigen::MatrixXd& dictionary,
            const Eigen::RowVectorXd& y,
            const Eigen::RowVectorXd* init = nullptr,
            SampleTrace* trace = nullptr,
            bool checkNan = false) const override;

    protected:
        int stepCount(Eigen::Index nBasis) const override;

    private:
        PursuitConfig cfg_;
    };

} // namespace spcode
