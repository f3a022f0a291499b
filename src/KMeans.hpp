#pragma once
#include "ClusteringStrategy.hpp"
#include <Eigen/Dense>
#include <random>
#include <vector>

/// Outcome of one K-means fit.
struct KMeansResult {
    std::vector<int> labels;
    Eigen::MatrixXd centers;   // k x dim
    double inertia = 0.0;      // sum of squared distances to the assigned center
    int iterations = 0;
    bool converged = false;    // false when max_iter was reached
};

/**
 * @class KMeans
 * @brief Lloyd's K-means with greedy k-means++ seeding.
 *
 * Features:
 * - Greedy k-means++ initialization, seeded explicitly
 * - Ties between equidistant centers go to the lowest center index
 * - Empty clusters take the point farthest from its own center
 * - Multiple restarts, best inertia kept
 */
class KMeans : public ClusteringStrategy {
public:
    /**
     * @param max_iter iteration cap per run
     * @param n_init number of seeded restarts
     * @param tol stop when the squared center shift is below tol * mean column variance
     */
    KMeans(int max_iter = 300, int n_init = 1, double tol = 1e-4);

    ClusterLabeling cluster(const FeatureMatrix& matrix, int k, unsigned seed) const override;

    /**
     * @brief Full fit on a raw matrix (rows are points).
     * @throws ParameterException unless 1 <= k <= X.rows()
     */
    KMeansResult fit(const Eigen::MatrixXd& X, int k, unsigned seed) const;

    /// Index of the nearest center, lowest index on ties.
    static int nearest_center(const Eigen::MatrixXd& centers, const Eigen::RowVectorXd& x, double* dist_sq = nullptr);

private:
    int max_iter_;
    int n_init_;
    double tol_;

    Eigen::MatrixXd init_centers(const Eigen::MatrixXd& X, int k, std::mt19937& rng) const;
    KMeansResult run_once(const Eigen::MatrixXd& X, int k, double tol, std::mt19937& rng) const;
};
