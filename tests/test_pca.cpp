// =============================================================================
// PCA tests
// =============================================================================

#include <gtest/gtest.h>
#include "ClusteringExceptions.hpp"
#include "PCA.hpp"
#include "test_helpers.hpp"
#include <cmath>
#include <numeric>
#include <random>
#include <vector>

class PCATest : public ::testing::Test {
protected:
    void SetUp() override { rng.seed(42); }

    std::mt19937 rng;

    Eigen::MatrixXd scaled_noise(int n, int d) {
        std::normal_distribution<double> dist(0.0, 1.0);
        Eigen::MatrixXd X(n, d);
        for(int i=0;i<n;++i)
            for(int j=0;j<d;++j)
                X(i,j) = dist(rng) * (d - j);
        return X;
    }
};

TEST_F(PCATest, RatiosAreSortedAndSumToAtMostOne) {
    FeatureMatrix m = as_feature_matrix(scaled_noise(40, 5));
    std::vector<double> ratios = PCA().explained_variance_ratios(m);

    ASSERT_EQ(ratios.size(), 5u);
    for(size_t i=1;i<ratios.size();++i) EXPECT_GE(ratios[i-1], ratios[i]);
    for(double r : ratios) EXPECT_GE(r, 0.0);
    double sum = std::accumulate(ratios.begin(), ratios.end(), 0.0);
    EXPECT_LE(sum, 1.0 + 1e-12);
    EXPECT_NEAR(sum, 1.0, 1e-9);
}

TEST_F(PCATest, RatioCountIsLimitedByRows) {
    FeatureMatrix m = as_feature_matrix(scaled_noise(3, 6));
    std::vector<double> ratios = PCA().explained_variance_ratios(m);

    ASSERT_EQ(ratios.size(), 3u);
    EXPECT_NEAR(ratios[2], 0.0, 1e-9);
}

TEST_F(PCATest, PointsOnALineHaveOneComponent) {
    Eigen::MatrixXd X(20, 2);
    for(int i=0;i<20;++i){
        X(i,0) = i - 7.0;
        X(i,1) = 2.0 * (i - 7.0) + 3.0;
    }
    FeatureMatrix m = as_feature_matrix(X);
    std::vector<double> ratios = PCA().explained_variance_ratios(m);

    EXPECT_NEAR(ratios[0], 1.0, 1e-9);
    EXPECT_NEAR(ratios[1], 0.0, 1e-9);

    Embedding2D emb = PCA().embed(m);
    ASSERT_EQ(emb.coords.rows(), 20);
    // Distances along the line are kept by the first axis
    EXPECT_NEAR(std::abs(emb.coords(19,0) - emb.coords(0,0)), std::sqrt(5.0) * 19.0, 1e-9);
    EXPECT_NEAR(emb.coords.col(1).cwiseAbs().maxCoeff(), 0.0, 1e-9);
}

TEST_F(PCATest, EmbeddingIsCenteredWithComponentVariance) {
    Eigen::MatrixXd X = scaled_noise(50, 4);
    PCAResult pca = PCA().fit(X);
    Eigen::MatrixXd Y = PCA::project(X, pca, 2);

    for(int c=0;c<2;++c){
        EXPECT_NEAR(Y.col(c).mean(), 0.0, 1e-9);
        double var = Y.col(c).squaredNorm() / (Y.rows() - 1);
        EXPECT_NEAR(var, pca.explained_variance(c), 1e-9);
    }
    // Axes are orthonormal
    Eigen::MatrixXd gram = pca.components.transpose() * pca.components;
    EXPECT_TRUE(gram.isApprox(Eigen::MatrixXd::Identity(4, 4), 1e-9));
}

TEST_F(PCATest, SignConventionIsStable) {
    Eigen::MatrixXd X = scaled_noise(30, 3);
    PCAResult pca = PCA().fit(X);

    for(int c=0;c<pca.components.cols();++c){
        Eigen::Index arg;
        pca.components.col(c).cwiseAbs().maxCoeff(&arg);
        EXPECT_GT(pca.components(arg, c), 0.0);
    }

    FeatureMatrix m = as_feature_matrix(X);
    EXPECT_TRUE(PCA().embed(m).coords.isApprox(PCA().embed(m, 99).coords));
}

TEST_F(PCATest, ZeroVarianceMatrixGivesZeros) {
    FeatureMatrix m = as_feature_matrix(Eigen::MatrixXd::Constant(10, 3, 4.2));

    std::vector<double> ratios = PCA().explained_variance_ratios(m);
    ASSERT_EQ(ratios.size(), 3u);
    for(double r : ratios) EXPECT_DOUBLE_EQ(r, 0.0);

    Embedding2D emb = PCA().embed(m);
    EXPECT_TRUE(emb.coords.allFinite());
    EXPECT_DOUBLE_EQ(emb.coords.cwiseAbs().maxCoeff(), 0.0);
}

TEST_F(PCATest, SingleColumnPadsSecondCoordinate) {
    Eigen::MatrixXd X(6, 1);
    X << 1, 2, 3, 4, 5, 6;
    FeatureMatrix m = as_feature_matrix(X);

    std::vector<double> ratios = PCA().explained_variance_ratios(m);
    ASSERT_EQ(ratios.size(), 1u);
    EXPECT_NEAR(ratios[0], 1.0, 1e-12);

    Embedding2D emb = PCA().embed(m);
    ASSERT_EQ(emb.coords.cols(), 2);
    EXPECT_NEAR(emb.coords(0,0), -2.5, 1e-12);
    EXPECT_DOUBLE_EQ(emb.coords.col(1).cwiseAbs().maxCoeff(), 0.0);
    EXPECT_EQ(emb.row_names, m.row_names());
}

TEST_F(PCATest, InvalidInputThrows) {
    EXPECT_THROW(PCA().explained_variance_ratios(FeatureMatrix()), DataException);
    EXPECT_THROW(PCA().fit(scaled_noise(5, 3), 4), ParameterException);
}
