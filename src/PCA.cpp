#include "PCA.hpp"
#include "ClusteringExceptions.hpp"
#include <Eigen/Eigenvalues>
#include <algorithm>

using namespace Eigen;

PCAResult PCA::fit(const MatrixXd& X, int n_components) const {
    if(X.size() == 0) throw DataException("PCA: input matrix is empty");
    if(!X.allFinite()) throw DataException("PCA: input contains NaN or infinite values");

    int N = (int)X.rows();
    int dim = (int)X.cols();
    int max_components = std::min(N, dim);
    if(n_components < 0 || n_components > max_components)
        throw ParameterException("PCA: n_components must be in [1, " + std::to_string(max_components) +
                                 "] (0 = all), got " + std::to_string(n_components));
    if(n_components == 0) n_components = max_components;

    PCAResult res;
    res.mean = X.colwise().mean();
    MatrixXd Xc = X.rowwise() - res.mean;

    MatrixXd cov = MatrixXd::Zero(dim, dim);
    if(N > 1) cov = (Xc.transpose() * Xc) / (double)(N - 1);
    SelfAdjointEigenSolver<MatrixXd> es(cov);
    if(es.info() != Success)
        throw DataException("PCA: eigendecomposition of the covariance failed");

    // Eigen sorts ascending; only min(N, dim) eigenvalues can be non-zero
    VectorXd all = es.eigenvalues().reverse().head(max_components).cwiseMax(0.0);
    MatrixXd axes = es.eigenvectors().rowwise().reverse().leftCols(n_components);

    for(int c = 0; c < n_components; ++c){
        Index arg;
        axes.col(c).cwiseAbs().maxCoeff(&arg);
        if(axes(arg, c) < 0) axes.col(c) *= -1.0;
    }

    res.components = axes;
    res.explained_variance = all.head(n_components);

    double total = all.sum();
    res.explained_variance_ratio.assign(n_components, 0.0);
    if(total > 0.0)
        for(int c = 0; c < n_components; ++c)
            res.explained_variance_ratio[c] = all(c) / total;
    return res;
}

MatrixXd PCA::project(const MatrixXd& X, const PCAResult& pca, int n_dims) {
    MatrixXd out = MatrixXd::Zero(X.rows(), n_dims);
    int available = std::min(n_dims, (int)pca.components.cols());
    for(int c = 0; c < available; ++c){
        // Zero-variance axes carry no direction
        if(pca.explained_variance(c) <= 0.0) continue;
        out.col(c) = (X.rowwise() - pca.mean) * pca.components.col(c);
    }
    return out;
}

Embedding2D PCA::embed(const FeatureMatrix& matrix) const {
    require_finite(matrix, "PCA");
    PCAResult pca = fit(matrix.values());
    return Embedding2D{matrix.row_names(), project(matrix.values(), pca, 2)};
}

Embedding2D PCA::embed(const FeatureMatrix& matrix, unsigned) const {
    return embed(matrix);
}

std::vector<double> PCA::explained_variance_ratios(const FeatureMatrix& matrix) const {
    require_finite(matrix, "PCA");
    return fit(matrix.values()).explained_variance_ratio;
}
