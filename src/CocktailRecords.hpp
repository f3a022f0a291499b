#pragma once
#include <optional>
#include <string>

/**
 * @brief Input records, as supplied by the table loading collaborator.
 *
 * Missing cells are std::nullopt. Categorical attributes are plain strings.
 */
struct CocktailRecord {
    std::string name;
    std::string glass;
    std::string prep_method;
    std::string strength;
    std::optional<double> abv;
};

struct IngredientRecord {
    std::string name;
    std::optional<std::string> type;   // e.g. "Gin", "Rum"
    std::string generalized_type;      // "Alcoholic" / "Non-alcoholic"
};

/// One (cocktail, ingredient) pair of a recipe.
struct CompositionRecord {
    std::string cocktail_name;
    std::string ingredient_name;
    std::optional<double> volume_oz;
};
