#pragma once
#include "DimensionalityReducer.hpp"
#include <Eigen/Dense>

/// Tuning of the neighbor embedding. Defaults follow common t-SNE practice.
struct TSNEOptions {
    enum class Init { Random, Pca };

    double perplexity = 30.0;          // effective neighbor count, must be < rows
    int max_iter = 1000;
    double early_exaggeration = 12.0;
    int exaggeration_iter = 100;       // iterations run with exaggerated P
    double learning_rate = -1.0;       // <= 0: max(N / early_exaggeration / 4, 50)
    double min_grad_norm = 1e-7;
    int n_iter_without_progress = 300;
    Init init = Init::Random;
    bool verbose = false;
};

struct TSNEResult {
    Eigen::MatrixXd embedding;   // N x 2
    double kl_divergence = 0.0;
    int iterations = 0;
};

/**
 * @class TSNE
 * @brief Exact t-SNE: Gaussian input affinities, Student-t output kernel.
 *
 * The embedding only has meaning for the points it was computed from;
 * there is no transform for new points. Running out of iterations is the
 * normal way to stop.
 */
class TSNE : public DimensionalityReducer {
public:
    explicit TSNE(TSNEOptions options = TSNEOptions());

    Embedding2D embed(const FeatureMatrix& matrix, unsigned seed) const override;

    /**
     * @throws ParameterException if perplexity is not in (0, rows)
     */
    TSNEResult fit(const Eigen::MatrixXd& X, unsigned seed) const;

    /**
     * @brief Symmetric joint probabilities P from squared distances.
     *
     * Each row's Gaussian precision is found by binary search so the row
     * entropy equals log(perplexity). Off-diagonal entries sum to 1.
     */
    static Eigen::MatrixXd joint_probabilities(const Eigen::MatrixXd& sq_distances, double perplexity);

    static Eigen::MatrixXd squared_distances(const Eigen::MatrixXd& X);

    /// KL(P || Q) of embedding Y, gradient written to grad.
    static double kl_divergence(const Eigen::MatrixXd& P, const Eigen::MatrixXd& Y, Eigen::MatrixXd& grad);

private:
    TSNEOptions options_;

    Eigen::MatrixXd initial_embedding(const Eigen::MatrixXd& X, unsigned seed) const;
    int gradient_descent(const Eigen::MatrixXd& P, Eigen::MatrixXd& Y, int it, int n_iter,
                         double momentum, double learning_rate, int n_iter_without_progress,
                         double& error) const;
};
