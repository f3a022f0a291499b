#include "SpectralClustering.hpp"
#include "ClusteringExceptions.hpp"
#include "KMeans.hpp"
#include <Eigen/Eigenvalues>
#include <algorithm>
#include <iostream>
#include <cmath>
#include <queue>
#include <set>
#include <string>
#include <vector>
#include <chrono>

using Clock = std::chrono::high_resolution_clock;
using namespace Eigen;

// ---------- Constructor ----------
SpectralClustering::SpectralClustering(int knn, Affinity affinity, int kmeans_runs, bool verbose)
    : knn_(knn), affinity_(affinity), kmeans_runs_(kmeans_runs), verbose_(verbose) {
    if(knn_ <= 0) throw ParameterException("SpectralClustering: knn must be positive");
    if(kmeans_runs_ <= 0) throw ParameterException("SpectralClustering: kmeans_runs must be positive");
}

// ---------- k-NN similarity ----------
MatrixXd SpectralClustering::compute_similarity(const MatrixXd& X) const {
    int N = (int)X.rows();
    MatrixXd W = MatrixXd::Zero(N,N);
    if(N < 2) return W;

    // Connectivity counts the point itself as one of its neighbors
    int m = affinity_ == Affinity::Connectivity ? std::min(knn_ - 1, N - 1) : std::min(knn_, N - 1);

    // Neighbors sorted by (distance, index) so ties resolve the same way everywhere
    std::vector<std::vector<std::pair<double,int>>> all_dists(N);
    #pragma omp parallel for schedule(static)
    for(int i=0;i<N;++i){
        all_dists[i].reserve(N-1);
        for(int j=0;j<N;++j){
            if(i==j) continue;
            all_dists[i].push_back({(X.row(i)-X.row(j)).norm(), j});
        }
        if(m > 0){
            std::nth_element(all_dists[i].begin(), all_dists[i].begin()+(m-1), all_dists[i].end());
            std::sort(all_dists[i].begin(), all_dists[i].begin()+m);
        }
    }

    if(affinity_ == Affinity::Connectivity){
        MatrixXd C = MatrixXd::Identity(N,N);
        for(int i=0;i<N;++i)
            for(int n=0;n<m;++n)
                C(i, all_dists[i][n].second) = 1.0;
        W = 0.5 * (C + C.transpose());
        return W;
    }

    std::vector<double> local_sigma(N);
    for(int i=0;i<N;++i)
        local_sigma[i] = std::max(all_dists[i][m-1].first, 1e-12);

    // Zelnik-Manor kernel
    for(int i=0;i<N;++i){
        for(int n=0;n<m;++n){
            int j = all_dists[i][n].second;
            double dist_sq = all_dists[i][n].first * all_dists[i][n].first;
            double w = std::exp(-dist_sq / (local_sigma[i] * local_sigma[j]));
            W(i,j) = w;
            W(j,i) = w; // Force symmetry
        }
    }
    return W;
}

// ---------- Laplacian ----------
MatrixXd SpectralClustering::compute_laplacian(const MatrixXd& W) {
    VectorXd D = W.rowwise().sum();
    // Avoid division by zero
    for(int i=0; i<D.size(); ++i) if(D(i) < 1e-12) D(i) = 1e-12;

    MatrixXd D_inv_sqrt = D.array().inverse().sqrt().matrix().asDiagonal();
    return MatrixXd::Identity(W.rows(),W.cols()) - D_inv_sqrt * W * D_inv_sqrt;
}

int SpectralClustering::count_components(const MatrixXd& W) {
    int N = (int)W.rows();
    std::vector<bool> seen(N, false);
    int components = 0;
    for(int s=0;s<N;++s){
        if(seen[s]) continue;
        ++components;
        std::queue<int> q;
        q.push(s);
        seen[s] = true;
        while(!q.empty()){
            int i = q.front(); q.pop();
            for(int j=0;j<N;++j)
                if(!seen[j] && W(i,j) > 0.0){ seen[j] = true; q.push(j); }
        }
    }
    return components;
}

SpectralResult SpectralClustering::fit(const MatrixXd& data, int k, unsigned seed) const {
    if(k <= 0 || k > data.rows())
        throw ParameterException("SpectralClustering: k must be in [1, " + std::to_string(data.rows()) +
                                 "], got " + std::to_string(k));

    auto t_start_total = Clock::now();
    SpectralResult res;
    int N = (int)data.rows();

    // ---------- Similarity ----------
    auto t1 = Clock::now();
    MatrixXd W = compute_similarity(data);
    res.connected_components = count_components(W);
    auto t2 = Clock::now();
    if(verbose_)
        std::cout << "[1/4] Similarity graph: " << std::chrono::duration<double>(t2 - t1).count() << " s\n";

    if(res.connected_components > 1)
        std::cerr << "[Spectral] Warning: affinity graph has " << res.connected_components
                  << " connected components, spectral embedding may not separate " << k << " clusters\n";

    // ---------- Laplacian ----------
    t1 = Clock::now();
    MatrixXd L = compute_laplacian(W);
    t2 = Clock::now();
    if(verbose_)
        std::cout << "[2/4] Laplacian: " << std::chrono::duration<double>(t2 - t1).count() << " s\n";

    // ---------- Eigen decomposition ----------
    t1 = Clock::now();
    SelfAdjointEigenSolver<MatrixXd> es(L);
    if(es.info() != Success)
        throw DataException("SpectralClustering: eigendecomposition of the Laplacian failed");
    t2 = Clock::now();
    if(verbose_)
        std::cout << "[3/4] Eigenvectors: " << std::chrono::duration<double>(t2 - t1).count() << " s\n";

    res.eigenvalues = es.eigenvalues().head(k);
    MatrixXd eigvecs = es.eigenvectors().leftCols(k);

    // Fix the sign: largest-magnitude entry of each eigenvector positive
    for(int c = 0; c < k; ++c){
        Index arg;
        eigvecs.col(c).cwiseAbs().maxCoeff(&arg);
        if(eigvecs(arg, c) < 0) eigvecs.col(c) *= -1.0;
    }

    // Normalize rows
    for(int i = 0; i < N; ++i){
        double norm = eigvecs.row(i).norm();
        if(norm > 1e-12) eigvecs.row(i) /= norm;
    }

    // ---------- K-means ----------
    t1 = Clock::now();
    KMeans kmeans(300, kmeans_runs_);
    res.labels = kmeans.fit(eigvecs, k, seed).labels;
    t2 = Clock::now();
    if(verbose_)
        std::cout << "[4/4] K-means: " << std::chrono::duration<double>(t2 - t1).count() << " s\n";

    std::set<int> distinct(res.labels.begin(), res.labels.end());
    if((int)distinct.size() < k)
        std::cerr << "[Spectral] Warning: only " << distinct.size() << " of " << k
                  << " clusters are populated\n";

    if(verbose_){
        auto t_end_total = Clock::now();
        std::cout << "--------------------------------------\n";
        std::cout << "Total Spectral Clustering time: "
                  << std::chrono::duration<double>(t_end_total - t_start_total).count()
                  << " s\n";
        std::cout << "--------------------------------------\n";
    }
    return res;
}

ClusterLabeling SpectralClustering::cluster(const FeatureMatrix& matrix, int k, unsigned seed) const {
    require_finite(matrix, "SpectralClustering");
    require_cluster_count(matrix, k, "SpectralClustering");

    SpectralResult res = fit(matrix.values(), k, seed);
    return ClusterLabeling{matrix.row_names(), res.labels};
}
