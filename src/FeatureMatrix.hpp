#pragma once
#include <Eigen/Dense>
#include <string>
#include <vector>

/**
 * @class FeatureMatrix
 * @brief Dense numeric table with named rows (cocktails) and named columns (features).
 *
 * Row and column names are unique and match the shape of the value matrix.
 * The same type carries normalized matrices: normalization keeps shape and names.
 */
class FeatureMatrix {
public:
    FeatureMatrix() = default;

    /**
     * @throws DataException on a shape mismatch or duplicate names
     */
    FeatureMatrix(std::vector<std::string> row_names,
                  std::vector<std::string> col_names,
                  Eigen::MatrixXd values);

    int rows() const { return (int)values_.rows(); }
    int cols() const { return (int)values_.cols(); }
    bool empty() const { return values_.size() == 0; }

    const std::vector<std::string>& row_names() const { return row_names_; }
    const std::vector<std::string>& col_names() const { return col_names_; }
    const Eigen::MatrixXd& values() const { return values_; }

    /// Index of a row / column by name, -1 when absent.
    int row_index(const std::string& name) const;
    int col_index(const std::string& name) const;

    /// Cell by names. @throws DataException for unknown names
    double at(const std::string& row, const std::string& col) const;

private:
    std::vector<std::string> row_names_;
    std::vector<std::string> col_names_;
    Eigen::MatrixXd values_;
};

typedef FeatureMatrix NormalizedMatrix;

/**
 * @brief Cluster id per row, in [0, k). Label values carry no order.
 */
struct ClusterLabeling {
    std::vector<std::string> row_names;
    std::vector<int> labels;

    int label_of(const std::string& row) const;
};

/**
 * @brief 2D coordinates per row, for visualization only.
 */
struct Embedding2D {
    std::vector<std::string> row_names;
    Eigen::MatrixXd coords;   // N x 2, columns are (x, y)
};

/// Throws DataException when the matrix is empty or holds NaN/Inf.
void require_finite(const FeatureMatrix& matrix, const std::string& who);

/// Throws ParameterException unless 1 <= k <= rows.
void require_cluster_count(const FeatureMatrix& matrix, int k, const std::string& who);
