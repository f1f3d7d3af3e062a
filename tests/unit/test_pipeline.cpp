#include <gtest/gtest.h>
#include "pipeline/learner_pipeline.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace slg;

class LearnerPipelineTest : public ::testing::Test {
protected:
    PipelineConfig config;
    Corpus cat_dog;

    void SetUp() override {
        config.verbose = false;
        cat_dog = Corpus::from_phrases("SG_2", {
            {"the", "dog", "ran"},
            {"the", "cat", "ran"},
            {"the", "cat", "quickly", "walked"},
            {"the", "cat", "slowly", "walked"}
        });
    }
};

// ==========================================
// Configuration Tests
// ==========================================

TEST(PipelineConfigTest, DefaultsAreValid) {
    PipelineConfig config = create_default_config();
    std::string error;
    EXPECT_TRUE(config.validate(error)) << error;
    EXPECT_EQ(config.min_length, 1);
    EXPECT_FALSE(config.max_length.has_value());
    EXPECT_EQ(config.context_width, 0);
    EXPECT_FALSE(config.should_render());
}

TEST(PipelineConfigTest, InvalidValues) {
    std::string error;

    PipelineConfig zero_min;
    zero_min.min_length = 0;
    EXPECT_FALSE(zero_min.validate(error));

    PipelineConfig inverted;
    inverted.min_length = 4;
    inverted.max_length = 2;
    EXPECT_FALSE(inverted.validate(error));
    EXPECT_NE(error.find("greater"), std::string::npos);

    PipelineConfig negative_width;
    negative_width.context_width = -2;
    EXPECT_FALSE(negative_width.validate(error));

    PipelineConfig granularity;
    granularity.granularity = "syllable";
    EXPECT_FALSE(granularity.validate(error));

    PipelineConfig segmentation;
    segmentation.segmentation = "paragraph";
    EXPECT_FALSE(segmentation.validate(error));

    PipelineConfig render;
    render.render_format = "svg";
    EXPECT_FALSE(render.validate(error));

    PipelineConfig report;
    report.report_format = "pdf";
    EXPECT_FALSE(report.validate(error));

    EXPECT_THROW(LearnerPipeline{inverted}, ConfigurationError);
}

TEST(PipelineConfigTest, LiteNeverRenders) {
    PipelineConfig config;
    config.visualize = true;
    EXPECT_TRUE(config.should_render());
    config.lite = true;
    EXPECT_FALSE(config.should_render());
}

TEST(PipelineConfigTest, JsonFileRoundTrip) {
    PipelineConfig config;
    config.min_length = 2;
    config.max_length = 5;
    config.granularity = "character";
    config.segmentation = "line";
    config.visualize = true;

    fs::path path = fs::temp_directory_path() / "slg_pipeline_config_test.json";
    config.to_json_file(path.string());
    PipelineConfig loaded = PipelineConfig::from_json_file(path.string());
    fs::remove(path);

    EXPECT_EQ(loaded.to_json(), config.to_json());
    ASSERT_TRUE(loaded.max_length.has_value());
    EXPECT_EQ(*loaded.max_length, 5);
}

TEST(PipelineConfigTest, MergeKeepsUnmentionedValues) {
    PipelineConfig config;
    config.max_length = 3;
    config.merge_json(nlohmann::json::parse(R"({"min_length": 2, "lite": true})"));

    EXPECT_EQ(config.min_length, 2);
    EXPECT_TRUE(config.lite);
    EXPECT_EQ(config.max_length.value_or(0), 3);

    config.merge_json(nlohmann::json::parse(R"({"max_length": null})"));
    EXPECT_FALSE(config.max_length.has_value());

    EXPECT_THROW(config.merge_json(nlohmann::json::parse(R"({"min_length": "two"})")),
                 ConfigurationError);
}

TEST(PipelineConfigTest, MinObservationsMustBePositive) {
    PipelineConfig config;
    config.merge_json(nlohmann::json::parse(R"({"min_observations": 3})"));
    EXPECT_EQ(config.min_observations, 3);

    EXPECT_THROW(config.merge_json(nlohmann::json::parse(R"({"min_observations": -1})")),
                 ConfigurationError);
    EXPECT_THROW(config.merge_json(nlohmann::json::parse(R"({"min_observations": 0})")),
                 ConfigurationError);
    EXPECT_THROW(config.merge_json(nlohmann::json::parse(R"({"min_observations": "many"})")),
                 ConfigurationError);
    EXPECT_EQ(config.min_observations, 3);
}

TEST(PipelineConfigTest, MissingConfigFile) {
    EXPECT_THROW(PipelineConfig::from_json_file("/nonexistent/slg_config.json"), InputError);
}

TEST(PipelineConfigTest, Environment) {
    setenv("SLG_MIN_LENGTH", "2", 1);
    setenv("SLG_MAX_LENGTH", "4", 1);
    setenv("SLG_GRANULARITY", "character", 1);
    PipelineConfig config = PipelineConfig::from_environment();
    EXPECT_EQ(config.min_length, 2);
    EXPECT_EQ(config.max_length.value_or(0), 4);
    EXPECT_EQ(config.granularity, "character");

    setenv("SLG_CONTEXT_WIDTH", "wide", 1);
    EXPECT_THROW(PipelineConfig::from_environment(), ConfigurationError);

    unsetenv("SLG_MIN_LENGTH");
    unsetenv("SLG_MAX_LENGTH");
    unsetenv("SLG_GRANULARITY");
    unsetenv("SLG_CONTEXT_WIDTH");
}

// ==========================================
// Run Tests
// ==========================================

TEST_F(LearnerPipelineTest, EmptyCorpusIsInputError) {
    LearnerPipeline pipeline(config);
    EXPECT_THROW(pipeline.run(Corpus{}), InputError);
}

TEST_F(LearnerPipelineTest, OneTokenSentenceIsDegenerate) {
    LearnerPipeline pipeline(config);
    PipelineResult result = pipeline.run(Corpus::from_phrases("one", {{"hello"}}));

    EXPECT_EQ(result.stats.substrings, 0);
    EXPECT_TRUE(result.graph.empty());
    EXPECT_TRUE(result.partition.empty());
    EXPECT_TRUE(result.grammar.fragments.empty());
    EXPECT_TRUE(result.is_degenerate());
    ASSERT_EQ(result.warnings.size(), 2);
    EXPECT_EQ(result.warnings[0].stage, "extraction");
    EXPECT_EQ(result.warnings[1].stage, "graph");
}

TEST_F(LearnerPipelineTest, NoSharedContextsWarnsButCompletes) {
    config.max_length = 1;
    LearnerPipeline pipeline(config);
    PipelineResult result = pipeline.run(Corpus::from_phrases("abc", {{"a", "b", "c"}}));

    EXPECT_EQ(result.stats.substrings, 3);
    EXPECT_EQ(result.stats.classes, 3);
    EXPECT_EQ(result.stats.singleton_classes, 3);
    ASSERT_EQ(result.warnings.size(), 1);
    EXPECT_EQ(result.warnings[0].stage, "graph");
}

TEST_F(LearnerPipelineTest, CatDogStatistics) {
    LearnerPipeline pipeline(config);
    PipelineResult result = pipeline.run(cat_dog);

    EXPECT_TRUE(result.warnings.empty());
    EXPECT_FALSE(result.is_degenerate());
    EXPECT_EQ(result.stats.sentences, 4);
    EXPECT_EQ(result.stats.tokens, 14);
    EXPECT_EQ(result.stats.substrings, 19);
    EXPECT_EQ(result.stats.nodes, 19);
    EXPECT_EQ(result.stats.classes, 9);
    EXPECT_EQ(result.stats.productive_fragments, 5);
    EXPECT_EQ(result.stats.unproductive_fragments, 4);
    EXPECT_EQ(result.stats.rules, result.grammar.num_rules());
    EXPECT_TRUE(result.partition.same_class({"cat"}, {"dog"}));
}

TEST_F(LearnerPipelineTest, Deterministic) {
    LearnerPipeline pipeline(config);
    PipelineResult first = pipeline.run(cat_dog);
    PipelineResult second = pipeline.run(cat_dog);

    EXPECT_EQ(first.partition.to_json(), second.partition.to_json());
    EXPECT_EQ(first.grammar.to_json(), second.grammar.to_json());
    EXPECT_EQ(first.graph.to_json(), second.graph.to_json());
}

TEST_F(LearnerPipelineTest, SentenceOrderDoesNotChangeClasses) {
    Corpus reversed = cat_dog;
    std::reverse(reversed.sentences.begin(), reversed.sentences.end());

    LearnerPipeline pipeline(config);
    EXPECT_EQ(pipeline.run(cat_dog).partition.to_json(),
              pipeline.run(reversed).partition.to_json());
}

TEST_F(LearnerPipelineTest, ProgressCallback) {
    LearnerPipeline pipeline(config);
    std::vector<std::string> stages;
    pipeline.set_progress_callback([&](const std::string& stage, int current, int total,
                                       const std::string&) {
        stages.push_back(stage);
        EXPECT_EQ(total, 4);
        EXPECT_LE(current, total);
    });

    pipeline.run(cat_dog);
    ASSERT_EQ(stages.size(), 4);
    EXPECT_EQ(stages.front(), "Extracting contexts");
    EXPECT_EQ(stages.back(), "Inducing grammar");
}

TEST_F(LearnerPipelineTest, RunPath) {
    fs::path path = fs::temp_directory_path() / "slg_pipeline_run_path.txt";
    {
        std::ofstream file(path);
        file << "The dog ran. The cat ran.";
    }

    LearnerPipeline pipeline(config);
    PipelineResult result = pipeline.run_path(path.string());
    fs::remove(path);

    EXPECT_EQ(result.corpus.name, "slg_pipeline_run_path.txt");
    EXPECT_EQ(result.stats.sentences, 2);
    EXPECT_TRUE(result.partition.same_class({"cat"}, {"dog"}));

    EXPECT_THROW(pipeline.run_path("/nonexistent/corpus.txt"), InputError);
}

TEST_F(LearnerPipelineTest, StatisticsJson) {
    LearnerPipeline pipeline(config);
    auto j = pipeline.run(cat_dog).stats.to_json();

    EXPECT_EQ(j["classes"], 9);
    EXPECT_TRUE(j.contains("total_time_seconds"));
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
