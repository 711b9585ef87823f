#include "Thresholding.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <vector>

namespace spcode {

    Eigen::MatrixXd softThreshold(const Eigen::MatrixXd& u, double threshold) {
        Eigen::MatrixXd shrunk = (u.array().abs() - threshold).cwiseMax(0.0).matrix();
        return signOf(u).cwiseProduct(shrunk);
    }

    Eigen::RowVectorXd keepLargest(const Eigen::RowVectorXd& v, Eigen::Index k) {
        const Eigen::Index n = v.size();
        Eigen::RowVectorXd out = Eigen::RowVectorXd::Zero(n);
        if (k <= 0 || n == 0) return out;
        if (k >= n) return v;

        // NaN ranks as +inf so the ordering stays strict weak
        std::vector<double> mag(static_cast<size_t>(n));
        for (Eigen::Index j = 0; j < n; ++j) {
            const double x = v[j];
            mag[static_cast<size_t>(j)] = std::isnan(x) ? std::numeric_limits<double>::infinity() : std::abs(x);
        }

        std::vector<Eigen::Index> idx(static_cast<size_t>(n));
        std::iota(idx.begin(), idx.end(), Eigen::Index(0));
        std::partial_sort(idx.begin(), idx.begin() + k, idx.end(),
            [&mag](Eigen::Index a, Eigen::Index b) {
                const double fa = mag[static_cast<size_t>(a)], fb = mag[static_cast<size_t>(b)];
                return fa > fb || (fa == fb && a < b);
            });
        for (Eigen::Index i = 0; i < k; ++i) {
            const Eigen::Index j = idx[static_cast<size_t>(i)];
            out[j] = v[j];
        }
        return out;
    }

    Eigen::MatrixXd signOf(const Eigen::MatrixXd& m) {
        return m.unaryExpr([](double x) { return double((x > 0.0) - (x < 0.0)); });
    }

} // namespace spcode
