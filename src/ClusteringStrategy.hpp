#pragma once
#include "FeatureMatrix.hpp"

/**
 * @brief Common interface of the clustering algorithms.
 *
 * Implementations are stateless: cluster() depends only on its arguments.
 */
class ClusteringStrategy {
public:
    virtual ~ClusteringStrategy() = default;

    /**
     * @brief Assign every row a label in [0, k).
     * @throws ParameterException unless 1 <= k <= rows
     * @throws DataException on an empty or non-finite matrix
     */
    virtual ClusterLabeling cluster(const FeatureMatrix& matrix, int k, unsigned seed) const = 0;
};
