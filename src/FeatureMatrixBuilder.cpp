#include "FeatureMatrixBuilder.hpp"
#include "ClusteringExceptions.hpp"
#include <algorithm>
#include <set>
#include <unordered_map>
#include <utility>

using namespace Eigen;

// ---------- OneHotEncoder ----------
OneHotEncoder::OneHotEncoder(std::vector<std::string> column_names)
    : column_names_(std::move(column_names)) {}

void OneHotEncoder::fit(const std::vector<std::vector<std::string>>& rows) {
    std::vector<std::set<std::string>> seen(column_names_.size());
    for(const auto& row : rows){
        if(row.size() != column_names_.size())
            throw DataException("one-hot encoder expects " + std::to_string(column_names_.size()) +
                                " values per row, got " + std::to_string(row.size()));
        for(size_t c=0;c<row.size();++c) seen[c].insert(row[c]);
    }
    categories_.assign(column_names_.size(), {});
    for(size_t c=0;c<seen.size();++c)
        categories_[c].assign(seen[c].begin(), seen[c].end());
    fitted_ = true;
}

MatrixXd OneHotEncoder::transform(const std::vector<std::vector<std::string>>& rows) const {
    if(!fitted_) throw ClusteringException("one-hot encoder used before fit()");

    std::vector<int> offsets(categories_.size() + 1, 0);
    for(size_t c=0;c<categories_.size();++c)
        offsets[c+1] = offsets[c] + (int)categories_[c].size();

    MatrixXd out = MatrixXd::Zero((Index)rows.size(), offsets.back());
    for(size_t i=0;i<rows.size();++i){
        const auto& row = rows[i];
        if(row.size() != categories_.size())
            throw DataException("one-hot encoder expects " + std::to_string(categories_.size()) +
                                " values per row, got " + std::to_string(row.size()));
        for(size_t c=0;c<row.size();++c){
            const auto& cats = categories_[c];
            auto it = std::lower_bound(cats.begin(), cats.end(), row[c]);
            if(it == cats.end() || *it != row[c]) continue; // unknown category
            out((Index)i, offsets[c] + (int)(it - cats.begin())) = 1.0;
        }
    }
    return out;
}

std::vector<std::string> OneHotEncoder::feature_names() const {
    std::vector<std::string> names;
    for(size_t c=0;c<categories_.size();++c)
        for(const auto& cat : categories_[c])
            names.push_back(column_names_[c] + "_" + cat);
    return names;
}

// ---------- FeatureMatrixBuilder ----------
FeatureMatrixBuilder::FeatureMatrixBuilder(DuplicatePolicy duplicates)
    : duplicates_(duplicates) {}

FeatureMatrix FeatureMatrixBuilder::build_volume_matrix(const std::vector<CompositionRecord>& compositions) const {
    struct Cell { double sum = 0.0; double last = 0.0; int count = 0; };

    std::map<std::string, std::map<std::string, Cell>> cells;
    std::set<std::string> ingredients;
    for(const auto& rec : compositions){
        double v = rec.volume_oz ? *rec.volume_oz : kMissingVolumeOz;
        Cell& cell = cells[rec.cocktail_name][rec.ingredient_name];
        cell.sum += v;
        cell.last = v;
        cell.count += 1;
        ingredients.insert(rec.ingredient_name);
    }

    std::vector<std::string> row_names;
    std::vector<std::string> col_names(ingredients.begin(), ingredients.end());
    std::unordered_map<std::string, int> col_of;
    for(size_t j=0;j<col_names.size();++j) col_of[col_names[j]] = (int)j;

    MatrixXd values = MatrixXd::Zero((Index)cells.size(), (Index)col_names.size());
    int i = 0;
    for(const auto& row : cells){
        row_names.push_back(row.first);
        for(const auto& entry : row.second){
            const Cell& cell = entry.second;
            double v = cell.last;
            if(duplicates_ == DuplicatePolicy::Sum) v = cell.sum;
            else if(duplicates_ == DuplicatePolicy::Mean) v = cell.sum / cell.count;
            values(i, col_of[entry.first]) = v;
        }
        ++i;
    }
    return FeatureMatrix(std::move(row_names), std::move(col_names), std::move(values));
}

std::vector<PrimaryAlcoholEntry> FeatureMatrixBuilder::build_primary_alcohol_table(
        const std::vector<CocktailRecord>& cocktails,
        const std::vector<IngredientRecord>& ingredients,
        const std::vector<CompositionRecord>& compositions) const {
    // First record wins for a repeated ingredient or cocktail name.
    std::unordered_map<std::string, const IngredientRecord*> ingredient_of;
    for(const auto& ing : ingredients) ingredient_of.emplace(ing.name, &ing);
    std::unordered_map<std::string, const CocktailRecord*> cocktail_of;
    for(const auto& c : cocktails) cocktail_of.emplace(c.name, &c);

    struct Joined {
        const std::string* cocktail;
        const std::string* type;
        std::optional<double> volume;
    };

    std::map<std::string, PrimaryAlcoholEntry> table;
    std::vector<Joined> alcoholic;
    for(const auto& rec : compositions){
        auto it = ingredient_of.find(rec.ingredient_name);
        if(it == ingredient_of.end()) continue;  // inner join drop
        const IngredientRecord& ing = *it->second;
        if(!ing.type) continue;

        auto& entry = table[rec.cocktail_name];
        entry.cocktail_name = rec.cocktail_name;
        if(ing.generalized_type == "Alcoholic")
            alcoholic.push_back({&rec.cocktail_name, &*ing.type, rec.volume_oz});
    }

    std::stable_sort(alcoholic.begin(), alcoholic.end(), [](const Joined& a, const Joined& b){
        if(*a.cocktail != *b.cocktail) return *a.cocktail < *b.cocktail;
        if(a.volume && b.volume) return *a.volume > *b.volume;
        return a.volume.has_value() && !b.volume.has_value();
    });

    for(const auto& row : alcoholic){
        auto& entry = table[*row.cocktail];
        if(!entry.primary_alcohol_type) entry.primary_alcohol_type = *row.type;
    }

    std::vector<PrimaryAlcoholEntry> out;
    out.reserve(table.size());
    for(auto& kv : table){
        auto c = cocktail_of.find(kv.first);
        if(c != cocktail_of.end()) kv.second.abv = c->second->abv;
        out.push_back(std::move(kv.second));
    }
    return out;
}

OneHotEncoder FeatureMatrixBuilder::make_style_encoder() {
    return OneHotEncoder({"glass", "prep_method", "strength"});
}

namespace {

std::vector<std::vector<std::string>> style_rows(const std::vector<CocktailRecord>& cocktails) {
    std::vector<std::vector<std::string>> rows;
    rows.reserve(cocktails.size());
    for(const auto& c : cocktails)
        rows.push_back({c.glass, c.prep_method, c.strength});
    return rows;
}

} // namespace

FeatureMatrix FeatureMatrixBuilder::build_style_matrix(const std::vector<CocktailRecord>& cocktails) const {
    OneHotEncoder encoder = make_style_encoder();
    encoder.fit(style_rows(cocktails));
    return build_style_matrix(cocktails, encoder);
}

FeatureMatrix FeatureMatrixBuilder::build_style_matrix(const std::vector<CocktailRecord>& cocktails,
                                                       const OneHotEncoder& encoder) const {
    std::vector<std::string> names;
    names.reserve(cocktails.size());
    for(const auto& c : cocktails) names.push_back(c.name);
    return FeatureMatrix(std::move(names), encoder.feature_names(), encoder.transform(style_rows(cocktails)));
}
