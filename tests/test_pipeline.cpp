// =============================================================================
// Records -> matrix -> normalized matrix -> labels / embeddings
// =============================================================================

#include <gtest/gtest.h>
#include "FeatureMatrixBuilder.hpp"
#include "KMeans.hpp"
#include "Normalizer.hpp"
#include "PCA.hpp"
#include "SpectralClustering.hpp"
#include "TSNE.hpp"
#include <memory>
#include <string>
#include <vector>

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        ingredients = {
            {"Gin", std::string("Gin"), "Alcoholic"},
            {"Lemon Juice", std::string("Juice"), "Non-alcoholic"},
            {"Rum", std::string("Rum"), "Alcoholic"},
            {"Lime Juice", std::string("Juice"), "Non-alcoholic"},
            {"Bourbon", std::string("Whiskey"), "Alcoholic"},
            {"Bitters", std::string("Bitters"), "Alcoholic"},
        };

        // Three families of four recipes, each family sharing its ingredients
        const char* families[3][3] = {{"Gin", "Lemon Juice", "gin_"},
                                      {"Rum", "Lime Juice", "rum_"},
                                      {"Bourbon", "Bitters", "whiskey_"}};
        for(int f=0;f<3;++f)
            for(int i=0;i<4;++i){
                std::string name = std::string(families[f][2]) + std::to_string(i);
                cocktails.push_back({name, f == 2 ? "Rocks" : "Coupe", "Shaken", "Medium", std::nullopt});
                compositions.push_back({name, families[f][0], 1.5 + 0.25 * i});
                compositions.push_back({name, families[f][1], i == 3 ? std::optional<double>() : 0.5 + 0.1 * i});
            }
    }

    std::vector<CocktailRecord> cocktails;
    std::vector<IngredientRecord> ingredients;
    std::vector<CompositionRecord> compositions;

    static void expect_families(const ClusterLabeling& labeling) {
        ASSERT_EQ(labeling.labels.size(), 12u);
        for(int f=0;f<3;++f)
            for(int i=1;i<4;++i)
                EXPECT_EQ(labeling.labels[f*4 + i], labeling.labels[f*4]);
        EXPECT_NE(labeling.labels[0], labeling.labels[4]);
        EXPECT_NE(labeling.labels[0], labeling.labels[8]);
        EXPECT_NE(labeling.labels[4], labeling.labels[8]);
    }
};

TEST_F(PipelineTest, FamiliesEndUpInSeparateClusters) {
    FeatureMatrixBuilder builder;
    FeatureMatrix volumes = builder.build_volume_matrix(compositions);
    ASSERT_EQ(volumes.rows(), 12);
    ASSERT_EQ(volumes.cols(), 6);
    EXPECT_DOUBLE_EQ(volumes.at("rum_3", "Lime Juice"), kMissingVolumeOz);

    NormalizedMatrix normalized = Normalizer().transform(volumes);
    // Rows sorted by name: gin_*, rum_*, whiskey_*
    EXPECT_EQ(normalized.row_names()[0], "gin_0");
    EXPECT_EQ(normalized.row_names()[11], "whiskey_3");

    std::vector<std::unique_ptr<ClusteringStrategy>> strategies;
    strategies.emplace_back(new KMeans());
    strategies.emplace_back(new SpectralClustering(4));
    for(const auto& strategy : strategies){
        ClusterLabeling labeling = strategy->cluster(normalized, 3, 42);
        EXPECT_EQ(labeling.row_names, normalized.row_names());
        expect_families(labeling);
    }
}

TEST_F(PipelineTest, EmbeddingsCoverEveryCocktail) {
    NormalizedMatrix normalized = Normalizer().transform(FeatureMatrixBuilder().build_volume_matrix(compositions));

    TSNEOptions options;
    options.perplexity = 3.0;
    options.max_iter = 300;
    options.exaggeration_iter = 30;

    std::vector<std::unique_ptr<DimensionalityReducer>> reducers;
    reducers.emplace_back(new PCA());
    reducers.emplace_back(new TSNE(options));
    for(const auto& reducer : reducers){
        Embedding2D emb = reducer->embed(normalized, 42);
        EXPECT_EQ(emb.row_names, normalized.row_names());
        ASSERT_EQ(emb.coords.rows(), 12);
        ASSERT_EQ(emb.coords.cols(), 2);
        EXPECT_TRUE(emb.coords.allFinite());
    }
}

TEST_F(PipelineTest, PrimaryAlcoholAndStyleTables) {
    FeatureMatrixBuilder builder;
    auto table = builder.build_primary_alcohol_table(cocktails, ingredients, compositions);

    ASSERT_EQ(table.size(), 12u);
    EXPECT_EQ(table[0].cocktail_name, "gin_0");
    EXPECT_EQ(table[0].primary_alcohol_type.value_or(""), "Gin");
    EXPECT_EQ(table[4].primary_alcohol_type.value_or(""), "Rum");
    // Bourbon outpours Bitters in every whiskey recipe
    for(int i=8;i<12;++i) EXPECT_EQ(table[i].primary_alcohol_type.value_or(""), "Whiskey");

    FeatureMatrix style = builder.build_style_matrix(cocktails);
    EXPECT_EQ(style.rows(), 12);
    EXPECT_EQ(style.col_names(), (std::vector<std::string>{
        "glass_Coupe", "glass_Rocks", "prep_method_Shaken", "strength_Medium"}));
}
