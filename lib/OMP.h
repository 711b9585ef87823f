#pragma once

#include "MP.h"

namespace spcode {

    /// Orthogonal matching pursuit (Pati, Rezaiifar & Krishnaprasad 1993).
    ///
    /// Atom selection as in MP, restricted to atoms not yet active. After each
    /// selection all active coefficients are refit jointly by minimum-norm least
    /// squares (the pseudo-inverse solution) and the residual is recomputed from the
    /// full refit, so ||residual|| never increases.
    class OMP : public PerSampleInference {
    public:
        explicit OMP(const PursuitConfig& cfg);

        std::string name() const override { return "OMP"; }
        const PursuitConfig& config() const { return cfg_; }

        /// A nonzero warm start seeds the active set with its support.
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
