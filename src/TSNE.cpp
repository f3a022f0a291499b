#include "TSNE.hpp"
#include "ClusteringExceptions.hpp"
#include "PCA.hpp"
#include "RandomUtils.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <random>
#include <string>
#include <vector>

using Clock = std::chrono::high_resolution_clock;
using namespace Eigen;

namespace {

const double kMachineEpsilon = std::numeric_limits<double>::epsilon();
constexpr double kPerplexityTolerance = 1e-5;
constexpr int kBinarySearchSteps = 100;
constexpr int kIterCheck = 50;
constexpr double kMinGain = 0.01;

} // namespace

TSNE::TSNE(TSNEOptions options) : options_(options) {
    if(options_.max_iter <= 0) throw ParameterException("TSNE: max_iter must be positive");
    if(options_.exaggeration_iter < 0 || options_.exaggeration_iter > options_.max_iter)
        throw ParameterException("TSNE: exaggeration_iter must be in [0, max_iter]");
    if(options_.early_exaggeration <= 0) throw ParameterException("TSNE: early_exaggeration must be positive");
}

MatrixXd TSNE::squared_distances(const MatrixXd& X) {
    int N = (int)X.rows();
    MatrixXd D(N, N);
    #pragma omp parallel for schedule(static)
    for(int i=0;i<N;++i)
        for(int j=0;j<N;++j)
            D(i,j) = i == j ? 0.0 : (X.row(i) - X.row(j)).squaredNorm();
    return D;
}

MatrixXd TSNE::joint_probabilities(const MatrixXd& D, double perplexity) {
    int N = (int)D.rows();
    MatrixXd P = MatrixXd::Zero(N, N);
    const double desired_entropy = std::log(perplexity);

    #pragma omp parallel for schedule(static)
    for(int i=0;i<N;++i){
        double beta = 1.0;
        double beta_min = -std::numeric_limits<double>::infinity();
        double beta_max = std::numeric_limits<double>::infinity();
        std::vector<double> row(N, 0.0);

        for(int step=0; step<kBinarySearchSteps; ++step){
            double sum_p = 0.0;
            for(int j=0;j<N;++j){
                row[j] = j == i ? 0.0 : std::exp(-D(i,j) * beta);
                sum_p += row[j];
            }
            if(sum_p == 0.0) sum_p = 1e-8;

            double sum_dist_p = 0.0;
            for(int j=0;j<N;++j){
                row[j] /= sum_p;
                sum_dist_p += D(i,j) * row[j];
            }

            double entropy = std::log(sum_p) + beta * sum_dist_p;
            double diff = entropy - desired_entropy;
            if(std::abs(diff) <= kPerplexityTolerance) break;

            if(diff > 0){
                beta_min = beta;
                beta = std::isinf(beta_max) ? beta * 2.0 : (beta + beta_max) / 2.0;
            } else {
                beta_max = beta;
                beta = std::isinf(beta_min) ? beta / 2.0 : (beta + beta_min) / 2.0;
            }
        }
        for(int j=0;j<N;++j) P(i,j) = row[j];
    }

    MatrixXd joint = P + P.transpose();
    double sum = std::max(joint.sum(), kMachineEpsilon);
    joint = (joint / sum).cwiseMax(kMachineEpsilon);
    joint.diagonal().setZero();
    return joint;
}

double TSNE::kl_divergence(const MatrixXd& P, const MatrixXd& Y, MatrixXd& grad) {
    int N = (int)Y.rows();

    // Student-t kernel with one degree of freedom
    MatrixXd num(N, N);
    for(int i=0;i<N;++i)
        for(int j=0;j<N;++j)
            num(i,j) = i == j ? 0.0 : 1.0 / (1.0 + (Y.row(i) - Y.row(j)).squaredNorm());
    double sum_q = std::max(num.sum(), kMachineEpsilon);
    MatrixXd Q = (num / sum_q).cwiseMax(kMachineEpsilon);
    Q.diagonal().setZero();

    double kl = 0.0;
    for(int i=0;i<N;++i)
        for(int j=0;j<N;++j)
            if(i != j) kl += P(i,j) * std::log(std::max(P(i,j), kMachineEpsilon) / Q(i,j));

    MatrixXd PQd = (P - Q).cwiseProduct(num);
    VectorXd row_sums = PQd.rowwise().sum();
    grad = 4.0 * (row_sums.asDiagonal() * Y - PQd * Y);
    return kl;
}

MatrixXd TSNE::initial_embedding(const MatrixXd& X, unsigned seed) const {
    int N = (int)X.rows();
    if(options_.init == TSNEOptions::Init::Pca){
        PCA pca;
        MatrixXd Y = PCA::project(X, pca.fit(X), 2);
        double mean = Y.col(0).mean();
        double stddev = std::sqrt((Y.col(0).array() - mean).square().mean());
        if(stddev > 0.0) return Y / stddev * 1e-4;
        std::cerr << "[t-SNE] Warning: PCA initialization is degenerate, using random initialization\n";
    }

    std::mt19937 rng(seed);
    MatrixXd Y(N, 2);
    for(int i=0;i<N;++i)
        for(int d=0;d<2;++d)
            Y(i,d) = 1e-4 * standard_normal(rng);
    return Y;
}

// Momentum gradient descent with per-coordinate gains. Returns the last iteration index.
int TSNE::gradient_descent(const MatrixXd& P, MatrixXd& Y, int it, int n_iter,
                           double momentum, double learning_rate, int n_iter_without_progress,
                           double& error) const {
    MatrixXd update = MatrixXd::Zero(Y.rows(), Y.cols());
    MatrixXd gains = MatrixXd::Ones(Y.rows(), Y.cols());
    MatrixXd grad;
    double best_error = std::numeric_limits<double>::max();
    int best_iter = it;
    int i = it;

    for(; i<n_iter; ++i){
        bool check_convergence = (i + 1) % kIterCheck == 0;
        error = kl_divergence(P, Y, grad);

        for(Index r=0;r<Y.rows();++r)
            for(Index c=0;c<Y.cols();++c){
                if(update(r,c) * grad(r,c) < 0.0) gains(r,c) += 0.2;
                else gains(r,c) *= 0.8;
                gains(r,c) = std::max(gains(r,c), kMinGain);
            }
        grad = grad.cwiseProduct(gains);
        update = momentum * update - learning_rate * grad;
        Y += update;

        if(check_convergence){
            double grad_norm = grad.norm();
            if(options_.verbose)
                std::cout << "[t-SNE] Iteration " << i + 1 << ": error = " << error
                          << ", gradient norm = " << grad_norm << "\n";
            if(error < best_error){
                best_error = error;
                best_iter = i;
            } else if(i - best_iter > n_iter_without_progress){
                if(options_.verbose)
                    std::cout << "[t-SNE] Iteration " << i + 1 << ": no progress during the last "
                              << n_iter_without_progress << " episodes. Finished.\n";
                break;
            }
            if(grad_norm <= options_.min_grad_norm){
                if(options_.verbose)
                    std::cout << "[t-SNE] Iteration " << i + 1 << ": gradient norm " << grad_norm << ". Finished.\n";
                break;
            }
        }
    }
    return i;
}

TSNEResult TSNE::fit(const MatrixXd& X, unsigned seed) const {
    int N = (int)X.rows();
    if(N == 0) throw DataException("TSNE: input matrix is empty");
    if(!X.allFinite()) throw DataException("TSNE: input contains NaN or infinite values");
    if(options_.perplexity <= 0 || options_.perplexity >= N)
        throw ParameterException("TSNE: perplexity must be in (0, " + std::to_string(N) +
                                 "), got " + std::to_string(options_.perplexity));

    TSNEResult res;
    auto t1 = Clock::now();
    MatrixXd P = joint_probabilities(squared_distances(X), options_.perplexity);
    auto t2 = Clock::now();
    if(options_.verbose)
        std::cout << "[t-SNE] Joint probabilities: " << std::chrono::duration<double>(t2 - t1).count() << " s\n";

    double learning_rate = options_.learning_rate > 0
        ? options_.learning_rate
        : std::max(N / options_.early_exaggeration / 4.0, 50.0);

    MatrixXd Y = initial_embedding(X, seed);

    // Early exaggeration phase
    t1 = Clock::now();
    double error = 0.0;
    P *= options_.early_exaggeration;
    int it = gradient_descent(P, Y, 0, options_.exaggeration_iter, 0.5, learning_rate,
                              options_.exaggeration_iter, error);
    P /= options_.early_exaggeration;

    if(it < options_.max_iter)
        it = gradient_descent(P, Y, it, options_.max_iter, 0.8, learning_rate,
                              options_.n_iter_without_progress, error);
    if(it < options_.max_iter) ++it; // stopped early at index it
    t2 = Clock::now();
    if(options_.verbose)
        std::cout << "[t-SNE] Optimization: " << std::chrono::duration<double>(t2 - t1).count() << " s\n";

    // KL of the final embedding
    MatrixXd grad;
    res.kl_divergence = kl_divergence(P, Y, grad);
    res.embedding = Y;
    res.iterations = it;
    return res;
}

Embedding2D TSNE::embed(const FeatureMatrix& matrix, unsigned seed) const {
    require_finite(matrix, "TSNE");
    TSNEResult res = fit(matrix.values(), seed);
    return Embedding2D{matrix.row_names(), res.embedding};
}
