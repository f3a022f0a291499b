#pragma once
#include "ClusteringStrategy.hpp"
#include <Eigen/Dense>
#include <vector>

/// Outcome of one spectral clustering fit.
struct SpectralResult {
    std::vector<int> labels;
    Eigen::VectorXd eigenvalues;   // the k smallest Laplacian eigenvalues, ascending
    int connected_components = 0;  // of the affinity graph
};

/**
 * @class SpectralClustering
 * @brief Spectral clustering with k-NN graph and normalized Laplacian.
 *
 * Features:
 * - k-NN affinity graph, binary connectivity or self-tuning kernel
 * - Normalized Laplacian L_sym
 * - Row-normalized eigenvectors before K-means
 * - Multiple K-means runs for better initialization
 *
 * With more connected components than requested clusters the eigenvectors of
 * the zero eigenvalue are not unique, and the requested k cannot be fully
 * honored. This is reported, not treated as an error.
 */
class SpectralClustering : public ClusteringStrategy {
public:
    enum class Affinity {
        Connectivity,   ///< 1 for each of the knn neighbors (self included), symmetrized
        SelfTuning      ///< exp(-d^2 / (sigma_i * sigma_j)), sigma_i = distance to the knn-th neighbor
    };

    /**
     * @brief Constructor
     * @param knn Number of nearest neighbors
     * @param affinity Edge weighting of the k-NN graph
     * @param kmeans_runs Number of K-means initializations
     * @param verbose Print stage timings to stdout
     */
    SpectralClustering(int knn = 10, Affinity affinity = Affinity::Connectivity,
                       int kmeans_runs = 10, bool verbose = false);

    ClusterLabeling cluster(const FeatureMatrix& matrix, int k, unsigned seed) const override;

    /**
     * @brief Fit clustering
     * @param data NxD data matrix
     */
    SpectralResult fit(const Eigen::MatrixXd& data, int k, unsigned seed) const;

    Eigen::MatrixXd compute_similarity(const Eigen::MatrixXd& X) const;

    static Eigen::MatrixXd compute_laplacian(const Eigen::MatrixXd& W);
    static int count_components(const Eigen::MatrixXd& W);

private:
    int knn_;
    Affinity affinity_;
    int kmeans_runs_;
    bool verbose_;
};
