#include <cmath>
#include <memory>

#include <gtest/gtest.h>

#include "LSM.h"
#include "Loss.h"
#include "TestData.h"

using namespace spcode;
using namespace spcode::testdata;

namespace {
    LSMConfig smallConfig() {
        LSMConfig cfg;
        cfg.n_iter = 60;
        cfg.n_iter_lsm = 3;
        cfg.sigma = 0.1;
        cfg.lr = 1e-2;
        return cfg;
    }
}

TEST(LSM, LambdasFollowReweightingRule) {
    LSMConfig cfg;
    cfg.alpha = 4.0;
    cfg.beta = 0.5;
    const LSM lsm(cfg);

    Eigen::MatrixXd prev(1, 3);
    prev << 0.0, -1.5, 0.5;
    const Eigen::MatrixXd lambdas = lsm.lambdas(prev);
    EXPECT_DOUBLE_EQ(lambdas(0, 0), 5.0 / 0.5);
    EXPECT_DOUBLE_EQ(lambdas(0, 1), 5.0 / 2.0);
    EXPECT_DOUBLE_EQ(lambdas(0, 2), 5.0 / 1.0);
}

TEST(LSM, FinalSolutionHasNoSmallCoefficients) {
    const Eigen::MatrixXd D = randomDictionary(8, 12, 1);
    Eigen::MatrixXd A = Eigen::MatrixXd::Zero(4, 12);
    A(0, 1) = 1.0; A(1, 5) = -0.8; A(2, 7) = 0.6; A(3, 2) = 1.2; A(3, 9) = -0.5;
    const Eigen::MatrixXd X = A * D.transpose();

    const LSMConfig cfg = smallConfig();
    const InferenceResult r = LSM(cfg).infer(D, X);

    ASSERT_EQ(r.coefficients.rows(), 4);
    ASSERT_EQ(r.coefficients.cols(), 12);
    EXPECT_TRUE(r.coefficients.allFinite());
    for (Eigen::Index i = 0; i < r.coefficients.size(); ++i) {
        const double v = std::abs(r.coefficients(i));
        EXPECT_TRUE(v == 0.0 || v >= cfg.sparse_threshold) << v;
    }
    EXPECT_EQ(r.iterations, cfg.n_iter_lsm);
}

TEST(LSM, TrajectoryHoldsOneSnapshotPerPass) {
    const Eigen::MatrixXd D = randomDictionary(6, 9, 2);
    const Eigen::MatrixXd X = randomMatrix(3, 6, 3);

    LSMConfig cfg = smallConfig();
    cfg.trajectory = TrajectoryMode::PostNonlinearity;
    const InferenceResult r = LSM(cfg).infer(D, X);

    ASSERT_EQ(r.trajectory.size(), static_cast<size_t>(cfg.n_iter_lsm) + 1);
    EXPECT_TRUE(r.trajectory.front().isZero(0.0));
    EXPECT_TRUE(r.trajectory.back() == r.coefficients);
}

TEST(LSM, RepeatedRunsAreIdentical) {
    const Eigen::MatrixXd D = randomDictionary(6, 9, 4);
    const Eigen::MatrixXd X = randomMatrix(3, 6, 5);

    const LSM lsm(smallConfig());
    EXPECT_TRUE(lsm.infer(D, X).coefficients == lsm.infer(D, X).coefficients);
}

TEST(LSM, InnerLoopLowersTheLoss) {
    const Eigen::MatrixXd D = randomDictionary(6, 9, 6);
    const Eigen::MatrixXd X = randomMatrix(3, 6, 7);

    LSMConfig cfg = smallConfig();
    cfg.n_iter_lsm = 1;
    cfg.n_iter = 200;
    cfg.sparse_threshold = 0.0;
    // lambda = 0.1 everywhere, so the reconstruction term dominates
    cfg.alpha = 0.0;
    cfg.beta = 10.0;
    const InferenceResult r = LSM(cfg).infer(D, X);

    const LSMLoss loss(LSM(cfg).lambdas(Eigen::MatrixXd::Zero(3, 9)), cfg.sigma);
    const Eigen::VectorXd start = loss.value(X, D, Eigen::MatrixXd::Zero(3, 9));
    const Eigen::VectorXd end = loss.value(X, D, r.coefficients);
    EXPECT_LT(end.sum(), start.sum());
}

TEST(LSM, RejectsBadConfiguration) {
    LSMConfig cfg;
    cfg.sigma = 0.0;
    EXPECT_THROW(LSM{ cfg }, InvalidConfigurationError);
    cfg = LSMConfig{};
    cfg.n_iter_lsm = -2;
    EXPECT_THROW(LSM{ cfg }, InvalidConfigurationError);
    EXPECT_THROW(LSM(LSMConfig{}, nullptr), InvalidConfigurationError);
}

TEST(LSMLoss, GradientMatchesFiniteDifferences) {
    const Eigen::MatrixXd D = randomDictionary(5, 7, 8);
    const Eigen::MatrixXd X = randomMatrix(2, 5, 9);
    Eigen::MatrixXd A = randomMatrix(2, 7, 10);
    const Eigen::MatrixXd lambdas = Eigen::MatrixXd::Constant(2, 7, 0.3);
    const LSMLoss loss(lambdas, 0.5);

    const Eigen::MatrixXd g = loss.gradient(X, D, A);
    const double h = 1e-6;
    for (Eigen::Index i = 0; i < A.rows(); ++i) {
        for (Eigen::Index j = 0; j < A.cols(); ++j) {
            Eigen::MatrixXd Ap = A, Am = A;
            Ap(i, j) += h;
            Am(i, j) -= h;
            const double fd = (loss.value(X, D, Ap).sum() - loss.value(X, D, Am).sum()) / (2 * h);
            EXPECT_NEAR(g(i, j), fd, 1e-5);
        }
    }
}

TEST(LSM, NanGuardCatchesDivergence) {
    const Eigen::MatrixXd D = orthonormalBasis(6, 20);
    const Eigen::MatrixXd X = randomMatrix(3, 6, 21);

    LSMConfig cfg;
    cfg.n_iter = 1000;
    cfg.n_iter_lsm = 1;
    cfg.sigma = 1.0;
    cfg.alpha = 0.0;
    cfg.beta = 1.0;
    // gradient is A - X D + sign(A); lr 10 makes each step scale A by about -9
    SGDConfig sgd;
    sgd.lr = 10.0;
    const LSM lsm(cfg, std::make_shared<SGD>(sgd));

    InferOptions guarded;
    guarded.checkNan = true;
    EXPECT_THROW(lsm.infer(D, X, guarded), NumericInstabilityError);
}
