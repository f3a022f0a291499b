#pragma once
#include "FeatureMatrix.hpp"
#include <vector>

/**
 * @class Normalizer
 * @brief Per-column quantile mapping onto a reference distribution.
 *
 * Each column's empirical quantiles are estimated from the column itself and
 * every value is replaced by its position on the reference axis. Fit and
 * applied on the same matrix.
 */
class Normalizer {
public:
    enum class Output { Uniform, Normal };

    explicit Normalizer(Output output = Output::Uniform);

    /**
     * @param quantile_count number of quantile points, 0 = row count
     * @throws ParameterException if quantile_count < 0 or > rows
     * @throws DataException on an empty or non-finite matrix
     */
    NormalizedMatrix transform(const FeatureMatrix& matrix, int quantile_count = 0) const;

    /**
     * @brief Quantiles of one column at evenly spaced probabilities, made non-decreasing.
     */
    static std::vector<double> column_quantiles(const Eigen::VectorXd& column, int quantile_count);

private:
    Output output_;

    double map_value(double x, const std::vector<double>& quantiles,
                     const std::vector<double>& references) const;
};

/// Standard normal inverse CDF, p in (0, 1).
double normal_quantile(double p);
