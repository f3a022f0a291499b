#pragma once
#include "FeatureMatrix.hpp"

/**
 * @brief Common interface of the 2D projections used for visualization.
 */
class DimensionalityReducer {
public:
    virtual ~DimensionalityReducer() = default;

    /// Deterministic reducers ignore the seed.
    virtual Embedding2D embed(const FeatureMatrix& matrix, unsigned seed) const = 0;
};
