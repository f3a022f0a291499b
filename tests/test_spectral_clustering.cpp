// =============================================================================
// Spectral clustering tests
// =============================================================================

#include <gtest/gtest.h>
#include "ClusteringExceptions.hpp"
#include "SpectralClustering.hpp"
#include "test_helpers.hpp"
#include <Eigen/Eigenvalues>
#include <random>
#include <set>
#include <vector>

class SpectralClusteringTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Seed RNG for reproducible tests
        rng.seed(42);
    }

    std::mt19937 rng;

    Eigen::MatrixXd three_blobs(int n = 30) {
        return make_blobs({{0.0, 0.0}, {5.0, 5.0}, {10.0, 0.0}}, n, 0.3, rng);
    }

    // Single elongated cloud, connected under a 10-NN graph
    Eigen::MatrixXd connected_cloud(int n) {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        Eigen::MatrixXd X(n, 2);
        for(int i=0;i<n;++i){
            X(i,0) = 4.0 * i / n;
            X(i,1) = 0.1 * dist(rng);
        }
        return X;
    }
};

TEST_F(SpectralClusteringTest, RecoversThreeBlobs) {
    Eigen::MatrixXd X = three_blobs();
    ClusterLabeling labeling = SpectralClustering().cluster(as_feature_matrix(X), 3, 42);

    ASSERT_EQ(labeling.labels.size(), 90u);
    EXPECT_GE(blob_agreement(labeling.labels, 3, 30, 3), 0.95);
}

TEST_F(SpectralClusteringTest, SelfTuningAffinityRecoversBlobs) {
    Eigen::MatrixXd X = three_blobs();
    SpectralClustering sc(7, SpectralClustering::Affinity::SelfTuning);
    ClusterLabeling labeling = sc.cluster(as_feature_matrix(X), 3, 42);

    EXPECT_GE(blob_agreement(labeling.labels, 3, 30, 3), 0.95);
}

TEST_F(SpectralClusteringTest, ReportsDisconnectedComponents) {
    Eigen::MatrixXd X = three_blobs();
    SpectralResult res = SpectralClustering().fit(X, 3, 42);

    EXPECT_EQ(res.connected_components, 3);
    ASSERT_EQ(res.eigenvalues.size(), 3);
    for(int i=0;i<3;++i) EXPECT_NEAR(res.eigenvalues(i), 0.0, 1e-8);
}

TEST_F(SpectralClusteringTest, ConnectedGraphHasOneComponent) {
    Eigen::MatrixXd X = connected_cloud(40);
    SpectralClustering sc;
    Eigen::MatrixXd W = sc.compute_similarity(X);

    EXPECT_EQ(SpectralClustering::count_components(W), 1);

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(SpectralClustering::compute_laplacian(W));
    EXPECT_NEAR(es.eigenvalues()(0), 0.0, 1e-8);
    EXPECT_GT(es.eigenvalues()(1), 1e-8);
}

TEST_F(SpectralClusteringTest, SimilarityIsSymmetric) {
    Eigen::MatrixXd X = three_blobs(8);
    for(auto affinity : {SpectralClustering::Affinity::Connectivity, SpectralClustering::Affinity::SelfTuning}){
        SpectralClustering sc(5, affinity);
        Eigen::MatrixXd W = sc.compute_similarity(X);
        EXPECT_TRUE(W.isApprox(W.transpose()));
        EXPECT_GE(W.minCoeff(), 0.0);
        EXPECT_LE(W.maxCoeff(), 1.0);
    }

    Eigen::MatrixXd C = SpectralClustering(5).compute_similarity(X);
    for(int i=0;i<C.rows();++i) EXPECT_DOUBLE_EQ(C(i,i), 1.0);
}

TEST_F(SpectralClusteringTest, SameSeedSameLabels) {
    FeatureMatrix m = as_feature_matrix(connected_cloud(50));

    SpectralClustering sc;
    ClusterLabeling a = sc.cluster(m, 4, 9);
    ClusterLabeling b = sc.cluster(m, 4, 9);
    EXPECT_EQ(a.labels, b.labels);
}

TEST_F(SpectralClusteringTest, SingleClusterLabelsEverythingTheSame) {
    FeatureMatrix m = as_feature_matrix(connected_cloud(25));
    ClusterLabeling labeling = SpectralClustering().cluster(m, 1, 3);

    std::set<int> distinct(labeling.labels.begin(), labeling.labels.end());
    EXPECT_EQ(distinct.size(), 1u);
    EXPECT_EQ(*distinct.begin(), 0);
}

TEST_F(SpectralClusteringTest, NeighborCountIsClippedToRows) {
    Eigen::MatrixXd X(4, 2);
    X << 0, 0,
         0, 1,
         8, 8,
         8, 9;
    Eigen::MatrixXd W = SpectralClustering(10).compute_similarity(X);

    // Every point is a neighbor of every other one
    EXPECT_TRUE(W.isApprox(Eigen::MatrixXd::Ones(4, 4)));
}

TEST_F(SpectralClusteringTest, NearestPairsSplitApart) {
    Eigen::MatrixXd X(4, 2);
    X << 0, 0,
         0, 1,
         8, 8,
         8, 9;
    SpectralResult res = SpectralClustering(2).fit(X, 2, 1);

    ASSERT_EQ(res.labels.size(), 4u);
    EXPECT_EQ(res.connected_components, 2);
    EXPECT_EQ(res.labels[0], res.labels[1]);
    EXPECT_EQ(res.labels[2], res.labels[3]);
    EXPECT_NE(res.labels[0], res.labels[2]);
}

TEST_F(SpectralClusteringTest, InvalidParametersThrow) {
    FeatureMatrix m = as_feature_matrix(three_blobs(2));
    EXPECT_THROW(SpectralClustering().cluster(m, 0, 1), ParameterException);
    EXPECT_THROW(SpectralClustering().cluster(m, 7, 1), ParameterException);
    EXPECT_THROW(SpectralClustering(0), ParameterException);
    EXPECT_THROW(SpectralClustering(10, SpectralClustering::Affinity::Connectivity, 0), ParameterException);
}
