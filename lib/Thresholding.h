#pragma once

#include <Eigen/Dense>

namespace spcode {

    /// a = sign(u) * max(|u| - threshold, 0), elementwise
    Eigen::MatrixXd softThreshold(const Eigen::MatrixXd& u, double threshold);

    /// Keep the k largest-magnitude entries of a row, zero the rest.
    /// Equal magnitudes are broken by the lower index; NaN ranks above every finite value.
    Eigen::RowVectorXd keepLargest(const Eigen::RowVectorXd& v, Eigen::Index k);

    /// sign() with sign(0) == 0
    Eigen::MatrixXd signOf(const Eigen::MatrixXd& m);

} // namespace spcode
