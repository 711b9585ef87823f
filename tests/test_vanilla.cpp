#include <gtest/gtest.h>

#include "Vanilla.h"
#include "TestData.h"

using namespace spcode;
using namespace spcode::testdata;

TEST(Vanilla, RandomInitIsSeededAndSmall) {
    const Eigen::MatrixXd D = randomDictionary(6, 10, 1);
    const Eigen::MatrixXd X = randomMatrix(4, 6, 2);

    VanillaConfig cfg;
    cfg.n_iter = 0;
    const InferenceResult a = Vanilla(cfg).infer(D, X);
    const InferenceResult b = Vanilla(cfg).infer(D, X);
    EXPECT_TRUE(a.coefficients == b.coefficients);
    EXPECT_LT(a.coefficients.cwiseAbs().maxCoeff(), 0.5 + 1e-12);
    EXPECT_FALSE(a.coefficients.isZero());

    cfg.seed = 42;
    const InferenceResult c = Vanilla(cfg).infer(D, X);
    EXPECT_FALSE(a.coefficients == c.coefficients);
}

TEST(Vanilla, RepeatedRunsAreIdentical) {
    const Eigen::MatrixXd D = randomDictionary(6, 10, 3);
    const Eigen::MatrixXd X = randomMatrix(4, 6, 4);

    VanillaConfig cfg;
    cfg.n_iter = 40;
    cfg.coeff_lr = 0.05;
    const Vanilla solver(cfg);
    EXPECT_TRUE(solver.infer(D, X).coefficients == solver.infer(D, X).coefficients);
}

TEST(Vanilla, WithoutPenaltyRecoversProjectionOnOrthonormalBasis) {
    const Eigen::MatrixXd D = orthonormalBasis(8, 5);
    const Eigen::MatrixXd X = randomMatrix(3, 8, 6);

    VanillaConfig cfg;
    cfg.n_iter = 200;
    cfg.coeff_lr = 0.5;
    cfg.sparsity_penalty = 0.0;
    const InferenceResult r = Vanilla(cfg).infer(D, X);
    EXPECT_TRUE(r.coefficients.isApprox(X * D, 1e-8));
}

TEST(Vanilla, WarmStartWithNoIterationsIsReturnedAsIs) {
    const Eigen::MatrixXd D = randomDictionary(6, 10, 7);
    const Eigen::MatrixXd X = randomMatrix(4, 6, 8);
    const Eigen::MatrixXd a0 = randomMatrix(4, 10, 9);

    VanillaConfig cfg;
    cfg.n_iter = 0;
    EXPECT_TRUE(Vanilla(cfg).inferWarmStart(D, X, a0).coefficients == a0);
}

TEST(Vanilla, TrajectoryRecordsEveryStep) {
    const Eigen::MatrixXd D = randomDictionary(6, 10, 10);
    const Eigen::MatrixXd X = randomMatrix(4, 6, 11);

    VanillaConfig cfg;
    cfg.n_iter = 25;
    cfg.coeff_lr = 0.01;
    cfg.trajectory = TrajectoryMode::PostNonlinearity;
    const InferenceResult r = Vanilla(cfg).infer(D, X);
    ASSERT_EQ(r.trajectory.size(), 26u);
    EXPECT_TRUE(r.trajectory.back() == r.coefficients);
}

TEST(Vanilla, EarlyStopShortensTrajectory) {
    const Eigen::MatrixXd D = randomDictionary(6, 10, 12);
    const Eigen::MatrixXd X = randomMatrix(4, 6, 13);

    VanillaConfig cfg;
    cfg.n_iter = 30;
    cfg.stop_early = true;
    cfg.epsilon = 1e9;
    cfg.trajectory = TrajectoryMode::PostNonlinearity;
    const InferenceResult r = Vanilla(cfg).infer(D, X);
    EXPECT_TRUE(r.stoppedEarly);
    EXPECT_EQ(r.trajectory.size(), 2u);
}

TEST(Vanilla, NanGuardCatchesExcessiveLearningRate) {
    const Eigen::MatrixXd D = randomDictionary(6, 10, 14);
    const Eigen::MatrixXd X = randomMatrix(4, 6, 15);

    VanillaConfig cfg;
    cfg.n_iter = 1000;
    cfg.coeff_lr = 100.0;
    InferOptions guarded;
    guarded.checkNan = true;
    EXPECT_THROW(Vanilla(cfg).infer(D, X, guarded), NumericInstabilityError);
}
