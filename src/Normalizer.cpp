#include "Normalizer.hpp"
#include "ClusteringExceptions.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

using namespace Eigen;

namespace {

// Values within this distance of the outer quantiles snap to the bounds.
constexpr double kBoundsThreshold = 1e-7;

// Piecewise-linear interpolation using the last knot <= x.
double interp_forward(double x, const std::vector<double>& xp, const std::vector<double>& fp) {
    size_t n = xp.size();
    size_t hi = std::upper_bound(xp.begin(), xp.end(), x) - xp.begin();
    if(hi == 0) return fp.front();
    if(hi == n) return fp.back();
    size_t lo = hi - 1;
    double t = (x - xp[lo]) / (xp[hi] - xp[lo]);
    return fp[lo] + t * (fp[hi] - fp[lo]);
}

// Same, using the first knot >= x.
double interp_backward(double x, const std::vector<double>& xp, const std::vector<double>& fp) {
    size_t n = xp.size();
    size_t hi = std::lower_bound(xp.begin(), xp.end(), x) - xp.begin();
    if(hi == 0) return fp.front();
    if(hi == n) return fp.back();
    size_t lo = hi - 1;
    double t = (x - xp[lo]) / (xp[hi] - xp[lo]);
    return fp[lo] + t * (fp[hi] - fp[lo]);
}

} // namespace

// Acklam's rational approximation, refined by one Halley step.
double normal_quantile(double p) {
    static const double a[] = {-3.969683028665376e+01, 2.209460984245205e+02, -2.759285104469687e+02,
                               1.383577518672690e+02, -3.066479806614716e+01, 2.506628277459239e+00};
    static const double b[] = {-5.447609879822406e+01, 1.615858368580409e+02, -1.556989798598866e+02,
                               6.680131188771972e+01, -1.328068155288572e+01};
    static const double c[] = {-7.784894002430293e-03, -3.223964580411365e-01, -2.400758277161838e+00,
                               -2.549732539343734e+00, 4.374664141464968e+00, 2.938163982698783e+00};
    static const double d[] = {7.784695709041462e-03, 3.224671290700398e-01, 2.445134137142996e+00,
                               3.754408661907416e+00};
    const double p_low = 0.02425;

    double x;
    if(p < p_low){
        double q = std::sqrt(-2.0 * std::log(p));
        x = (((((c[0]*q + c[1])*q + c[2])*q + c[3])*q + c[4])*q + c[5]) /
            ((((d[0]*q + d[1])*q + d[2])*q + d[3])*q + 1.0);
    } else if(p <= 1.0 - p_low){
        double q = p - 0.5;
        double r = q * q;
        x = (((((a[0]*r + a[1])*r + a[2])*r + a[3])*r + a[4])*r + a[5]) * q /
            (((((b[0]*r + b[1])*r + b[2])*r + b[3])*r + b[4])*r + 1.0);
    } else {
        double q = std::sqrt(-2.0 * std::log(1.0 - p));
        x = -(((((c[0]*q + c[1])*q + c[2])*q + c[3])*q + c[4])*q + c[5]) /
             ((((d[0]*q + d[1])*q + d[2])*q + d[3])*q + 1.0);
    }

    double e = 0.5 * std::erfc(-x / std::sqrt(2.0)) - p;
    double u = e * std::sqrt(2.0 * 3.14159265358979323846) * std::exp(x * x / 2.0);
    return x - u / (1.0 + x * u / 2.0);
}

Normalizer::Normalizer(Output output) : output_(output) {}

std::vector<double> Normalizer::column_quantiles(const VectorXd& column, int quantile_count) {
    std::vector<double> sorted(column.data(), column.data() + column.size());
    std::sort(sorted.begin(), sorted.end());
    int n = (int)sorted.size();

    std::vector<double> q(quantile_count);
    for(int i=0;i<quantile_count;++i){
        double p = quantile_count == 1 ? 0.0 : (double)i / (quantile_count - 1);
        double h = p * (n - 1);
        int lo = (int)std::floor(h);
        int hi = std::min(lo + 1, n - 1);
        q[i] = sorted[lo] + (h - lo) * (sorted[hi] - sorted[lo]);
    }
    // interpolation round-off can break monotonicity
    for(int i=1;i<quantile_count;++i) q[i] = std::max(q[i], q[i-1]);
    return q;
}

double Normalizer::map_value(double x, const std::vector<double>& quantiles,
                             const std::vector<double>& references) const {
    const double lower_x = quantiles.front();
    const double upper_x = quantiles.back();

    bool at_lower, at_upper;
    if(output_ == Output::Uniform){
        at_lower = x - kBoundsThreshold < lower_x;
        at_upper = x + kBoundsThreshold > upper_x;
    } else {
        at_lower = x == lower_x;
        at_upper = x == upper_x;
    }

    // Averaging both directions puts a value repeated over several
    // quantiles in the middle of its run.
    double y = 0.5 * (interp_forward(x, quantiles, references) + interp_backward(x, quantiles, references));
    if(at_upper) y = references.back();
    if(at_lower) y = references.front();

    if(output_ == Output::Normal){
        y = std::min(std::max(y, kBoundsThreshold), 1.0 - kBoundsThreshold);
        y = normal_quantile(y);
    }
    return y;
}

NormalizedMatrix Normalizer::transform(const FeatureMatrix& matrix, int quantile_count) const {
    require_finite(matrix, "Normalizer");
    if(quantile_count < 0 || quantile_count > matrix.rows())
        throw ParameterException("Normalizer: quantile count must be in [1, " + std::to_string(matrix.rows()) +
                                 "] (0 = row count), got " + std::to_string(quantile_count));
    if(quantile_count == 0) quantile_count = matrix.rows();

    std::vector<double> references(quantile_count);
    for(int i=0;i<quantile_count;++i)
        references[i] = quantile_count == 1 ? 0.0 : (double)i / (quantile_count - 1);

    const MatrixXd& X = matrix.values();
    MatrixXd out(X.rows(), X.cols());
    #pragma omp parallel for schedule(static)
    for(int j=0;j<(int)X.cols();++j){
        std::vector<double> quantiles = column_quantiles(X.col(j), quantile_count);
        for(int i=0;i<(int)X.rows();++i)
            out(i,j) = map_value(X(i,j), quantiles, references);
    }
    return NormalizedMatrix(matrix.row_names(), matrix.col_names(), std::move(out));
}
