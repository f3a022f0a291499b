#include "ClusteringExceptions.hpp"
#include "CocktailRecords.hpp"
#include "FeatureMatrixBuilder.hpp"
#include "KMeans.hpp"
#include "Normalizer.hpp"
#include "PCA.hpp"
#include "SpectralClustering.hpp"
#include "TSNE.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

struct CsvTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    int column(const std::string& name, const std::string& filename) const {
        for(size_t i=0;i<header.size();++i)
            if(header[i] == name) return (int)i;
        throw IOException(filename + ": missing column '" + name + "'");
    }
};

/**
 * @brief Splits one CSV record, honoring double-quoted fields.
 */
std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for(size_t i=0;i<line.size();++i){
        char ch = line[i];
        if(quoted){
            if(ch == '"' && i+1 < line.size() && line[i+1] == '"'){ field += '"'; ++i; }
            else if(ch == '"') quoted = false;
            else field += ch;
        } else if(ch == '"') quoted = true;
        else if(ch == ','){ fields.push_back(field); field.clear(); }
        else if(ch != '\r') field += ch;
    }
    fields.push_back(field);
    return fields;
}

/**
 * @brief Reads CSV with a header row
 */
CsvTable read_csv(const std::string& filename) {
    std::ifstream file(filename);
    if(!file.is_open())
        throw IOException("cannot open file: " + filename);

    CsvTable table;
    std::string line;
    if(!std::getline(file, line))
        throw IOException(filename + " is empty");
    table.header = split_csv_line(line);
    while(std::getline(file,line)){
        if(line.empty() || line == "\r") continue;
        auto fields = split_csv_line(line);
        fields.resize(table.header.size());
        table.rows.push_back(std::move(fields));
    }
    return table;
}

std::optional<double> parse_number(const std::string& cell) {
    if(cell.empty()) return std::nullopt;
    try {
        return std::stod(cell);
    } catch(const std::exception&) {
        return std::nullopt;
    }
}

std::vector<CocktailRecord> load_cocktails(const std::string& filename) {
    CsvTable t = read_csv(filename);
    int name = t.column("name", filename), glass = t.column("glass", filename);
    int prep = t.column("prep_method", filename), strength = t.column("strength", filename);
    int abv = t.column("abv", filename);

    std::vector<CocktailRecord> out;
    for(const auto& r : t.rows)
        out.push_back({r[name], r[glass], r[prep], r[strength], parse_number(r[abv])});
    return out;
}

std::vector<IngredientRecord> load_ingredients(const std::string& filename) {
    CsvTable t = read_csv(filename);
    int name = t.column("name", filename), type = t.column("type", filename);
    int general = t.column("generalized_type", filename);

    std::vector<IngredientRecord> out;
    for(const auto& r : t.rows){
        std::optional<std::string> ty;
        if(!r[type].empty()) ty = r[type];
        out.push_back({r[name], ty, r[general]});
    }
    return out;
}

std::vector<CompositionRecord> load_compositions(const std::string& filename) {
    CsvTable t = read_csv(filename);
    int cocktail = t.column("cocktail_name", filename), ingredient = t.column("ingredient_name", filename);
    int volume = t.column("volume_oz", filename);

    std::vector<CompositionRecord> out;
    for(const auto& r : t.rows)
        out.push_back({r[cocktail], r[ingredient], parse_number(r[volume])});
    return out;
}

std::string csv_quote(const std::string& field) {
    std::string out = "\"";
    for(char ch : field){
        if(ch == '"') out += '"';
        out += ch;
    }
    return out + "\"";
}

std::ofstream open_output(const std::string& filename) {
    std::filesystem::path p(filename);
    if(!p.parent_path().empty())
        std::filesystem::create_directories(p.parent_path());

    std::ofstream file(filename);
    if(!file.is_open())
        throw IOException("cannot write to: " + filename);
    return file;
}

/**
 * @brief Saves labels to CSV
 */
void save_labels_csv(const std::string& filename, const ClusterLabeling& labeling){
    std::ofstream file = open_output(filename);
    file << "cocktail_name,label\n";
    for(size_t i=0;i<labeling.labels.size();++i)
        file << csv_quote(labeling.row_names[i]) << "," << labeling.labels[i] << "\n";
    std::cout << "Labels saved to " << filename << std::endl;
}

void save_embedding_csv(const std::string& filename, const Embedding2D& embedding){
    std::ofstream file = open_output(filename);
    file << "cocktail_name,x,y\n";
    for(size_t i=0;i<embedding.row_names.size();++i)
        file << csv_quote(embedding.row_names[i]) << "," << embedding.coords(i,0) << "," << embedding.coords(i,1) << "\n";
    std::cout << "Embedding saved to " << filename << std::endl;
}

void save_ratios_csv(const std::string& filename, const std::vector<double>& ratios){
    std::ofstream file = open_output(filename);
    file << "component,ratio\n";
    for(size_t i=0;i<ratios.size();++i)
        file << i + 1 << "," << ratios[i] << "\n";
    std::cout << "Explained variance saved to " << filename << std::endl;
}

void save_primary_alcohol_csv(const std::string& filename, const std::vector<PrimaryAlcoholEntry>& table){
    std::ofstream file = open_output(filename);
    file << "cocktail_name,primary_alcohol_type\n";
    for(const auto& e : table)
        file << csv_quote(e.cocktail_name) << "," << csv_quote(e.primary_alcohol_type.value_or("")) << "\n";
    std::cout << "Primary alcohol types saved to " << filename << std::endl;
}

int main(int argc, char** argv){
    std::string data_dir = "data";
    int k = 5;             // default clusters
    std::string out_dir = "results";
    unsigned seed = 42;

    // Parse command line arguments: data_dir k out_dir seed
    if(argc > 1) data_dir = argv[1];
    if(argc > 2) k = std::stoi(argv[2]);
    if(argc > 3) out_dir = argv[3];
    if(argc > 4) seed = (unsigned)std::stoul(argv[4]);

    try {
        auto cocktails = load_cocktails(data_dir + "/cocktails.csv");
        auto ingredients = load_ingredients(data_dir + "/ingredients.csv");
        auto compositions = load_compositions(data_dir + "/cocktails_and_ingredients.csv");
        std::cout << "Read " << cocktails.size() << " cocktails, " << ingredients.size()
                  << " ingredients, " << compositions.size() << " compositions.\n";

        FeatureMatrixBuilder builder;
        FeatureMatrix volumes = builder.build_volume_matrix(compositions);
        std::cout << "Volume matrix: " << volumes.rows() << " x " << volumes.cols() << "\n";
        save_primary_alcohol_csv(out_dir + "/primary_alcohol.csv",
                                 builder.build_primary_alcohol_table(cocktails, ingredients, compositions));

        NormalizedMatrix normalized = Normalizer().transform(volumes);

        std::cout << "Running clustering with k=" << k << ", seed=" << seed << std::endl;
        save_labels_csv(out_dir + "/labels_kmeans.csv", KMeans().cluster(normalized, k, seed));
        SpectralClustering spectral(10, SpectralClustering::Affinity::Connectivity, 10, true);
        save_labels_csv(out_dir + "/labels_spectral.csv", spectral.cluster(normalized, k, seed));

        PCA pca;
        save_ratios_csv(out_dir + "/explained_variance.csv", pca.explained_variance_ratios(normalized));
        save_embedding_csv(out_dir + "/embedding_pca.csv", pca.embed(normalized));

        TSNEOptions options;
        options.perplexity = std::min(options.perplexity, std::max(1.0, (normalized.rows() - 1) / 3.0));
        save_embedding_csv(out_dir + "/embedding_tsne.csv", TSNE(options).embed(normalized, seed));
    } catch(const ClusteringException& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch(const std::filesystem::filesystem_error& e) {
        std::cerr << "IO Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
