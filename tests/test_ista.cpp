#include <gtest/gtest.h>

#include <limits>

#include <Eigen/SVD>

#include "ISTA.h"
#include "Thresholding.h"
#include "TestData.h"

using namespace spcode;
using namespace spcode::testdata;

namespace {
    double objective(const Eigen::MatrixXd& D, const Eigen::MatrixXd& X,
        const Eigen::MatrixXd& A, double lambda)
    {
        return 0.5 * (X - A * D.transpose()).squaredNorm() + lambda * A.cwiseAbs().sum();
    }
}

TEST(ISTA, StepSizeIsInverseLipschitzConstant) {
    const Eigen::MatrixXd D = randomMatrix(7, 12, 1);
    const double sigmaMax = Eigen::JacobiSVD<Eigen::MatrixXd>(D).singularValues()(0);

    const double step = ISTA::stepSize(D);
    EXPECT_NEAR(step * sigmaMax * sigmaMax, 1.0, 1e-10);
    EXPECT_NEAR(step * ISTA::lipschitzConstant(D), 1.0, 1e-12);

    ISTAConfig cfg;
    cfg.sparsity_penalty = 0.3;
    EXPECT_NEAR(ISTA(cfg).threshold(D), step * 0.3, 1e-15);
}

TEST(ISTA, OrthonormalBasisGivesSoftThresholdedProjection) {
    const Eigen::MatrixXd D = orthonormalBasis(8, 2);
    const Eigen::MatrixXd X = randomMatrix(4, 8, 3);

    ISTAConfig cfg;
    cfg.n_iter = 10;
    cfg.sparsity_penalty = 0.25;
    const InferenceResult r = ISTA(cfg).infer(D, X);
    EXPECT_TRUE(r.coefficients.isApprox(softThreshold(X * D, 0.25), 1e-10));
}

TEST(ISTA, ObjectiveNeverIncreases) {
    const Eigen::MatrixXd D = randomDictionary(10, 20, 4);
    const Eigen::MatrixXd X = randomMatrix(5, 10, 5);

    ISTAConfig cfg;
    cfg.n_iter = 60;
    cfg.sparsity_penalty = 0.1;
    cfg.trajectory = TrajectoryMode::PostNonlinearity;
    const InferenceResult r = ISTA(cfg).infer(D, X);

    ASSERT_EQ(r.trajectory.size(), 61u);
    double previous = objective(D, X, r.trajectory.front(), cfg.sparsity_penalty);
    for (size_t t = 1; t < r.trajectory.size(); ++t) {
        const double current = objective(D, X, r.trajectory[t], cfg.sparsity_penalty);
        EXPECT_LE(current, previous + 1e-9) << "step " << t;
        previous = current;
    }
}

TEST(ISTA, ResultIsSparserWithLargerPenalty) {
    const Eigen::MatrixXd D = randomDictionary(10, 20, 6);
    const Eigen::MatrixXd X = randomMatrix(5, 10, 7);

    ISTAConfig low, high;
    low.sparsity_penalty = 0.01;
    high.sparsity_penalty = 1.0;
    const auto nnz = [](const Eigen::MatrixXd& m) { return (m.array() != 0.0).count(); };
    EXPECT_LT(nnz(ISTA(high).infer(D, X).coefficients), nnz(ISTA(low).infer(D, X).coefficients));
}

TEST(ISTA, EarlyStopShortensTrajectory) {
    const Eigen::MatrixXd D = randomDictionary(6, 10, 8);
    const Eigen::MatrixXd X = randomMatrix(3, 6, 9);

    ISTAConfig cfg;
    cfg.n_iter = 100;
    cfg.stop_early = true;
    cfg.epsilon = 1e9;
    cfg.trajectory = TrajectoryMode::PostNonlinearity;
    const InferenceResult r = ISTA(cfg).infer(D, X);
    EXPECT_TRUE(r.stoppedEarly);
    EXPECT_EQ(r.iterations, 1);
    EXPECT_LT(r.trajectory.size(), 101u);
}

TEST(ISTA, DegenerateDictionaryIsNumericInstability) {
    const Eigen::MatrixXd D = Eigen::MatrixXd::Zero(4, 6);
    const Eigen::MatrixXd X = randomMatrix(2, 4, 10);
    EXPECT_THROW(ISTA().infer(D, X), NumericInstabilityError);
}

TEST(ISTA, RawTrajectoryKeepsPreThresholdValues) {
    const Eigen::MatrixXd D = orthonormalBasis(6, 11);
    const Eigen::MatrixXd X = randomMatrix(3, 6, 12);

    ISTAConfig cfg;
    cfg.n_iter = 3;
    cfg.sparsity_penalty = 0.4;
    cfg.trajectory = TrajectoryMode::RawState;
    const InferenceResult r = ISTA(cfg).infer(D, X);

    ASSERT_EQ(r.trajectory.size(), 4u);
    // one gradient step from zero lands on X D for an orthonormal basis
    EXPECT_TRUE(r.trajectory[1].isApprox(X * D, 1e-10));
}

TEST(ISTA, NanGuardCatchesNonFiniteData) {
    const Eigen::MatrixXd D = randomDictionary(6, 10, 13);
    Eigen::MatrixXd X = randomMatrix(3, 6, 14);
    X(0, 2) = std::numeric_limits<double>::infinity();

    ISTAConfig cfg;
    cfg.n_iter = 5;
    InferOptions guarded;
    guarded.checkNan = true;
    EXPECT_THROW(ISTA(cfg).infer(D, X, guarded), NumericInstabilityError);
}

TEST(ISTA, EarlyStopOnEmptyBatch) {
    const Eigen::MatrixXd D = orthonormalBasis(4, 15);
    const Eigen::MatrixXd X(0, 4);

    ISTAConfig cfg;
    cfg.n_iter = 3;
    cfg.stop_early = true;
    const InferenceResult r = ISTA(cfg).infer(D, X);
    EXPECT_EQ(r.coefficients.rows(), 0);
    EXPECT_EQ(r.coefficients.cols(), 4);
    EXPECT_EQ(r.iterations, 3);
    EXPECT_FALSE(r.stoppedEarly);
}
