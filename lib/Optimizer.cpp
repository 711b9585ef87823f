#include "Optimizer.h"
#include "Errors.h"

#include <cmath>
#include <string>

namespace spcode {

    SGD::SGD(const SGDConfig& cfg) : cfg_(cfg) {
        if (!(cfg_.lr > 0.0))
            throw InvalidConfigurationError("SGD lr must be > 0, got " + std::to_string(cfg_.lr));
        if (cfg_.momentum < 0.0 || cfg_.momentum >= 1.0)
            throw InvalidConfigurationError("SGD momentum must be in [0, 1), got " + std::to_string(cfg_.momentum));
    }

    void SGD::step(Eigen::MatrixXd& parameters, const Eigen::MatrixXd& gradient) {
        if (cfg_.momentum == 0.0) {
            parameters -= cfg_.lr * gradient;
            return;
        }
        if (velocity_.rows() != gradient.rows() || velocity_.cols() != gradient.cols())
            velocity_ = Eigen::MatrixXd::Zero(gradient.rows(), gradient.cols());
        velocity_ = cfg_.momentum * velocity_ + gradient;
        parameters -= cfg_.lr * velocity_;
    }

    void SGD::reset() {
        velocity_.resize(0, 0);
    }

    std::unique_ptr<GradientOptimizer> SGD::clone() const {
        return std::make_unique<SGD>(*this);
    }

    Adam::Adam(const AdamConfig& cfg) : cfg_(cfg) {
        if (!(cfg_.lr > 0.0))
            throw InvalidConfigurationError("Adam lr must be > 0, got " + std::to_string(cfg_.lr));
        if (cfg_.beta1 < 0.0 || cfg_.beta1 >= 1.0 || cfg_.beta2 < 0.0 || cfg_.beta2 >= 1.0)
            throw InvalidConfigurationError("Adam betas must be in [0, 1)");
    }

    void Adam::step(Eigen::MatrixXd& parameters, const Eigen::MatrixXd& gradient) {
        if (m_.rows() != gradient.rows() || m_.cols() != gradient.cols()) {
            m_ = Eigen::MatrixXd::Zero(gradient.rows(), gradient.cols());
            v_ = Eigen::MatrixXd::Zero(gradient.rows(), gradient.cols());
            t_ = 0;
        }
        ++t_;
        m_ = cfg_.beta1 * m_ + (1.0 - cfg_.beta1) * gradient;
        v_ = cfg_.beta2 * v_ + (1.0 - cfg_.beta2) * gradient.cwiseAbs2();

        const double bc1 = 1.0 - std::pow(cfg_.beta1, t_);
        const double bc2 = 1.0 - std::pow(cfg_.beta2, t_);
        const double stepSize = cfg_.lr / bc1;
        const Eigen::ArrayXXd denom = (v_.array() / bc2).sqrt() + cfg_.eps;
        parameters.array() -= stepSize * (m_.array() / denom);
    }

    void Adam::reset() {
        m_.resize(0, 0);
        v_.resize(0, 0);
        t_ = 0;
    }

    std::unique_ptr<GradientOptimizer> Adam::clone() const {
        return std::make_unique<Adam>(*this);
    }

} // namespace spcode
