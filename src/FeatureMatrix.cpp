#include "FeatureMatrix.hpp"
#include "ClusteringExceptions.hpp"
#include <unordered_set>
#include <utility>

namespace {

void require_unique(const std::vector<std::string>& names, const char* axis) {
    std::unordered_set<std::string> seen;
    for(const auto& n : names)
        if(!seen.insert(n).second)
            throw DataException(std::string("duplicate ") + axis + " name '" + n + "'");
}

int index_of(const std::vector<std::string>& names, const std::string& name) {
    for(size_t i = 0; i < names.size(); ++i)
        if(names[i] == name) return (int)i;
    return -1;
}

} // namespace

FeatureMatrix::FeatureMatrix(std::vector<std::string> row_names,
                             std::vector<std::string> col_names,
                             Eigen::MatrixXd values)
    : row_names_(std::move(row_names)), col_names_(std::move(col_names)), values_(std::move(values)) {
    if((int)row_names_.size() != values_.rows() || (int)col_names_.size() != values_.cols())
        throw DataException("matrix is " + std::to_string(values_.rows()) + "x" + std::to_string(values_.cols()) +
                            " but has " + std::to_string(row_names_.size()) + " row names and " +
                            std::to_string(col_names_.size()) + " column names");
    require_unique(row_names_, "row");
    require_unique(col_names_, "column");
}

int FeatureMatrix::row_index(const std::string& name) const { return index_of(row_names_, name); }

int FeatureMatrix::col_index(const std::string& name) const { return index_of(col_names_, name); }

double FeatureMatrix::at(const std::string& row, const std::string& col) const {
    int r = row_index(row);
    int c = col_index(col);
    if(r < 0) throw DataException("unknown row '" + row + "'");
    if(c < 0) throw DataException("unknown column '" + col + "'");
    return values_(r, c);
}

int ClusterLabeling::label_of(const std::string& row) const {
    for(size_t i = 0; i < row_names.size(); ++i)
        if(row_names[i] == row) return labels[i];
    throw DataException("unknown row '" + row + "'");
}

void require_finite(const FeatureMatrix& matrix, const std::string& who) {
    if(matrix.empty())
        throw DataException(who + ": input matrix is empty");
    if(!matrix.values().allFinite())
        throw DataException(who + ": input matrix contains NaN or infinite values");
}

void require_cluster_count(const FeatureMatrix& matrix, int k, const std::string& who) {
    if(k <= 0 || k > matrix.rows())
        throw ParameterException(who + ": k must be in [1, " + std::to_string(matrix.rows()) +
                                 "], got " + std::to_string(k));
}
