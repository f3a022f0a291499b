#pragma once
#include "CocktailRecords.hpp"
#include "FeatureMatrix.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Value used for an ingredient whose volume was not measured.
 *
 * Keeps "present but unmeasured" apart from "absent" (0).
 */
constexpr double kMissingVolumeOz = 0.01;

/**
 * @brief How repeated (cocktail, ingredient) pairs are merged in the volume matrix.
 */
enum class DuplicatePolicy {
    LastWins,   ///< keep the volume of the last record seen
    Sum,        ///< add the volumes up
    Mean        ///< average them (pivot-table aggregation)
};

/// Primary alcohol row: type of the largest alcoholic ingredient of a cocktail.
struct PrimaryAlcoholEntry {
    std::string cocktail_name;
    std::optional<std::string> primary_alcohol_type;   // empty: no alcoholic ingredient
    std::optional<double> abv;
};

/**
 * @class OneHotEncoder
 * @brief Indicator encoding of categorical columns.
 *
 * Categories are learned by fit() and sorted per column. Values not seen at
 * fit time encode as all-zero in their column group.
 */
class OneHotEncoder {
public:
    explicit OneHotEncoder(std::vector<std::string> column_names);

    /// @param rows one vector of values per row, one value per column
    void fit(const std::vector<std::vector<std::string>>& rows);

    Eigen::MatrixXd transform(const std::vector<std::vector<std::string>>& rows) const;

    /// "<column>_<category>" for every output column, in output order.
    std::vector<std::string> feature_names() const;

    bool fitted() const { return fitted_; }

private:
    std::vector<std::string> column_names_;
    std::vector<std::vector<std::string>> categories_;
    bool fitted_ = false;
};

/**
 * @class FeatureMatrixBuilder
 * @brief Turns cocktail, ingredient and composition records into feature matrices.
 */
class FeatureMatrixBuilder {
public:
    explicit FeatureMatrixBuilder(DuplicatePolicy duplicates = DuplicatePolicy::LastWins);

    /**
     * @brief Cocktail x ingredient matrix of volumes in oz.
     *
     * Rows and columns are sorted by name. Unmeasured volumes become
     * kMissingVolumeOz, pairs that never occur are 0.
     */
    FeatureMatrix build_volume_matrix(const std::vector<CompositionRecord>& compositions) const;

    /**
     * @brief Primary alcohol type per cocktail, sorted by cocktail name.
     *
     * Compositions whose ingredient is unknown, and ingredients with no type,
     * are dropped without error. A cocktail that survives the join but has no
     * "Alcoholic" ingredient gets an empty primary type. Among equal volumes
     * the composition listed first wins; unmeasured volumes rank last.
     */
    std::vector<PrimaryAlcoholEntry> build_primary_alcohol_table(
        const std::vector<CocktailRecord>& cocktails,
        const std::vector<IngredientRecord>& ingredients,
        const std::vector<CompositionRecord>& compositions) const;

    /**
     * @brief One-hot encoding of glass, prep_method and strength, rows in input order.
     * @throws DataException on duplicate cocktail names
     */
    FeatureMatrix build_style_matrix(const std::vector<CocktailRecord>& cocktails) const;

    /// Same, with an encoder fitted elsewhere. Unseen categories encode as zeros.
    FeatureMatrix build_style_matrix(const std::vector<CocktailRecord>& cocktails,
                                     const OneHotEncoder& encoder) const;

    static OneHotEncoder make_style_encoder();

private:
    DuplicatePolicy duplicates_;
};
