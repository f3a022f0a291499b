#include "KMeans.hpp"
#include "ClusteringExceptions.hpp"
#include "RandomUtils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <string>
#include <utility>

using namespace Eigen;

KMeans::KMeans(int max_iter, int n_init, double tol)
    : max_iter_(max_iter), n_init_(n_init), tol_(tol) {
    if(max_iter_ <= 0) throw ParameterException("KMeans: max_iter must be positive");
    if(n_init_ <= 0) throw ParameterException("KMeans: n_init must be positive");
    if(tol_ < 0) throw ParameterException("KMeans: tol must be non-negative");
}

int KMeans::nearest_center(const MatrixXd& centers, const RowVectorXd& x, double* dist_sq) {
    double best = (x - centers.row(0)).squaredNorm();
    int best_idx = 0;
    for(int j=1;j<centers.rows();++j){
        double d = (x - centers.row(j)).squaredNorm();
        if(d < best){ best = d; best_idx = j; }
    }
    if(dist_sq) *dist_sq = best;
    return best_idx;
}

// Greedy k-means++: each new center is the best of a few D^2-sampled candidates.
MatrixXd KMeans::init_centers(const MatrixXd& X, int k, std::mt19937& rng) const {
    int N = (int)X.rows();
    MatrixXd centers(k, X.cols());
    int n_trials = 2 + (int)std::log((double)k);

    int first = uniform_index(rng, N);
    centers.row(0) = X.row(first);

    VectorXd closest(N);
    for(int i=0;i<N;++i) closest(i) = (X.row(i) - centers.row(0)).squaredNorm();
    double potential = closest.sum();

    for(int c=1;c<k;++c){
        std::vector<double> cumsum(N);
        std::partial_sum(closest.data(), closest.data() + N, cumsum.begin());

        int best_candidate = -1;
        double best_potential = std::numeric_limits<double>::max();
        VectorXd best_closest;
        for(int t=0;t<n_trials;++t){
            int candidate;
            if(potential <= 0.0){
                candidate = uniform_index(rng, N);
            } else {
                double r = uniform01(rng) * potential;
                candidate = (int)(std::upper_bound(cumsum.begin(), cumsum.end(), r) - cumsum.begin());
                candidate = std::min(candidate, N - 1);
            }

            VectorXd cand_closest(N);
            for(int i=0;i<N;++i)
                cand_closest(i) = std::min(closest(i), (X.row(i) - X.row(candidate)).squaredNorm());
            double cand_potential = cand_closest.sum();
            if(cand_potential < best_potential){
                best_potential = cand_potential;
                best_candidate = candidate;
                best_closest = cand_closest;
            }
        }

        centers.row(c) = X.row(best_candidate);
        closest = best_closest;
        potential = best_potential;
    }
    return centers;
}

KMeansResult KMeans::run_once(const MatrixXd& X, int k, double tol, std::mt19937& rng) const {
    int N = (int)X.rows();
    int dim = (int)X.cols();

    KMeansResult res;
    res.centers = init_centers(X, k, rng);
    std::vector<int> labels(N, -1);
    std::vector<int> assigned(N);

    for(int it=0; it<max_iter_; ++it){
        res.iterations = it + 1;

        // Assignment step
        #pragma omp parallel for schedule(static)
        for(int i=0;i<N;++i)
            assigned[i] = nearest_center(res.centers, X.row(i));

        if(assigned == labels){
            res.converged = true;
            break;
        }
        labels = assigned;

        // Update step
        MatrixXd new_centers = MatrixXd::Zero(k, dim);
        VectorXi counts = VectorXi::Zero(k);
        for(int i=0;i<N;++i){
            new_centers.row(labels[i]) += X.row(i);
            counts(labels[i]) += 1;
        }

        if((counts.array() == 0).any()){
            // Refill empty clusters with the points farthest from their own center.
            std::vector<double> dist(N);
            for(int i=0;i<N;++i) dist[i] = (X.row(i) - res.centers.row(labels[i])).squaredNorm();
            std::vector<int> order(N);
            std::iota(order.begin(), order.end(), 0);
            std::stable_sort(order.begin(), order.end(), [&](int a, int b){ return dist[a] > dist[b]; });

            size_t next = 0;
            for(int c=0;c<k;++c){
                if(counts(c) > 0) continue;
                while(next < order.size() && counts(labels[order[next]]) <= 1) ++next;
                if(next == order.size()) break;
                int i = order[next++];
                new_centers.row(labels[i]) -= X.row(i);
                counts(labels[i]) -= 1;
                labels[i] = c;
                new_centers.row(c) = X.row(i);
                counts(c) = 1;
            }
        }

        for(int j=0;j<k;++j)
            if(counts(j) > 0) new_centers.row(j) /= counts(j);
            else new_centers.row(j) = res.centers.row(j);

        double shift = (res.centers - new_centers).squaredNorm();
        res.centers = new_centers;
        if(shift <= tol){
            res.converged = true;
            break;
        }
    }

    // Labels consistent with the final centers
    res.labels.resize(N);
    std::vector<double> d2(N);
    #pragma omp parallel for schedule(static)
    for(int i=0;i<N;++i)
        res.labels[i] = nearest_center(res.centers, X.row(i), &d2[i]);
    res.inertia = std::accumulate(d2.begin(), d2.end(), 0.0);
    return res;
}

KMeansResult KMeans::fit(const MatrixXd& X, int k, unsigned seed) const {
    if(k <= 0 || k > X.rows())
        throw ParameterException("KMeans: k must be in [1, " + std::to_string(X.rows()) +
                                 "], got " + std::to_string(k));
    if(!X.allFinite())
        throw DataException("KMeans: input contains NaN or infinite values");

    // Absolute tolerance from the mean per-column variance
    RowVectorXd mean = X.colwise().mean();
    double mean_var = (X.rowwise() - mean).array().square().colwise().mean().mean();
    double tol = tol_ * mean_var;

    std::mt19937 rng(seed);
    KMeansResult best;
    best.inertia = std::numeric_limits<double>::max();
    for(int run=0; run<n_init_; ++run){
        KMeansResult res = run_once(X, k, tol, rng);
        if(res.inertia < best.inertia) best = std::move(res);
    }
    return best;
}

ClusterLabeling KMeans::cluster(const FeatureMatrix& matrix, int k, unsigned seed) const {
    require_finite(matrix, "KMeans");
    require_cluster_count(matrix, k, "KMeans");

    KMeansResult res = fit(matrix.values(), k, seed);
    return ClusterLabeling{matrix.row_names(), res.labels};
}
