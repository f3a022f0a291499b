#pragma once
#include "DimensionalityReducer.hpp"
#include <Eigen/Dense>
#include <vector>

/// Principal axes of a centered matrix, strongest first.
struct PCAResult {
    Eigen::RowVectorXd mean;              // column means
    Eigen::MatrixXd components;           // dim x n_components, one axis per column
    Eigen::VectorXd explained_variance;   // covariance eigenvalues, non-increasing
    std::vector<double> explained_variance_ratio;
};

/**
 * @class PCA
 * @brief Variance-maximizing linear projection via covariance eigendecomposition.
 *
 * Each axis is sign-fixed so its largest-magnitude loading is positive.
 * A zero-variance matrix gives zero ratios and a zero embedding.
 */
class PCA : public DimensionalityReducer {
public:
    PCA() = default;

    Embedding2D embed(const FeatureMatrix& matrix, unsigned seed) const override;
    Embedding2D embed(const FeatureMatrix& matrix) const;

    /**
     * @brief Variance share of every component, non-increasing, summing to at most 1.
     */
    std::vector<double> explained_variance_ratios(const FeatureMatrix& matrix) const;

    /**
     * @param n_components number of axes to keep, 0 = min(rows, cols)
     */
    PCAResult fit(const Eigen::MatrixXd& X, int n_components = 0) const;

    /// Rows of X projected on the first n_dims axes, missing axes padded with 0.
    static Eigen::MatrixXd project(const Eigen::MatrixXd& X, const PCAResult& pca, int n_dims);
};
