#include <gtest/gtest.h>
#include "report/report_writer.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

using namespace slg;

class ReportWriterTest : public ::testing::Test {
protected:
    PipelineResult result;

    void SetUp() override {
        PipelineConfig config;
        config.verbose = false;
        result = LearnerPipeline(config).run(Corpus::from_phrases("SG_2", {
            {"the", "dog", "ran"},
            {"the", "cat", "ran"},
            {"the", "cat", "quickly", "walked"},
            {"the", "cat", "slowly", "walked"}
        }));
    }

    static ReportConfig plain() {
        ReportConfig config;
        config.include_timestamp = false;
        return config;
    }
};

// ==========================================
// Format Selection Tests
// ==========================================

TEST(ReportFormatTest, ParseNames) {
    EXPECT_EQ(parse_report_format("text"), ReportFormat::PLAIN_TEXT);
    EXPECT_EQ(parse_report_format("Markdown"), ReportFormat::MARKDOWN);
    EXPECT_EQ(parse_report_format("md"), ReportFormat::MARKDOWN);
    EXPECT_EQ(parse_report_format("json"), ReportFormat::JSON);
    EXPECT_THROW(parse_report_format("html"), ConfigurationError);
}

TEST(ReportFormatTest, FromExtension) {
    EXPECT_EQ(format_from_extension("out/report.json"), ReportFormat::JSON);
    EXPECT_EQ(format_from_extension("report.MD"), ReportFormat::MARKDOWN);
    EXPECT_EQ(format_from_extension("report.txt"), ReportFormat::PLAIN_TEXT);
    EXPECT_EQ(format_from_extension("report"), ReportFormat::PLAIN_TEXT);
}

TEST(ReportFormatTest, ResolveAuto) {
    EXPECT_EQ(resolve_report_format("auto", "r.json"), ReportFormat::JSON);
    EXPECT_EQ(resolve_report_format("text", "r.json"), ReportFormat::PLAIN_TEXT);
    EXPECT_THROW(resolve_report_format("yaml", "r.txt"), ConfigurationError);
}

// ==========================================
// Content Tests
// ==========================================

TEST_F(ReportWriterTest, PlainTextSections) {
    std::string report = ReportWriter(result).generate(plain());

    EXPECT_NE(report.find("VERTICES"), std::string::npos);
    EXPECT_NE(report.find("EDGES"), std::string::npos);
    EXPECT_NE(report.find("SHARED CONTEXTS"), std::string::npos);
    EXPECT_NE(report.find("CONGRUENCE CLASSES"), std::string::npos);
    EXPECT_NE(report.find("Alphabet: {cat, dog, quickly, ran, slowly, the, walked}"), std::string::npos);
    EXPECT_NE(report.find("Start strings:"), std::string::npos);
    EXPECT_NE(report.find("Insufficiently attested:"), std::string::npos);
    EXPECT_EQ(report.find("Generated:"), std::string::npos);
}

TEST_F(ReportWriterTest, PlainTextRules) {
    std::string report = ReportWriter(result).generate(plain());

    EXPECT_NE(report.find("N0 (2): {cat, dog}"), std::string::npos);
    EXPECT_NE(report.find("  N5 (1): {the}\n"), std::string::npos);
    EXPECT_NE(report.find("N3 {quickly, slowly}: 1 context pattern"), std::string::npos);
    EXPECT_NE(report.find("S -> <s> the N0 ran </s>"), std::string::npos);
    EXPECT_NE(report.find("N0 -> cat"), std::string::npos);
    EXPECT_NE(report.find("N6 -> N5 N0"), std::string::npos);
    EXPECT_NE(report.find("cat -- dog  (<s> the _ ran </s>)"), std::string::npos);
}

TEST_F(ReportWriterTest, Markdown) {
    ReportConfig config = plain();
    config.format = ReportFormat::MARKDOWN;
    config.title = "Cats";
    std::string report = ReportWriter(result).generate(config);

    EXPECT_EQ(report.rfind("# Cats", 0), 0);
    EXPECT_NE(report.find("## Statistics"), std::string::npos);
    EXPECT_NE(report.find("| Congruence classes | 9 |"), std::string::npos);
    EXPECT_NE(report.find("- **N0** (2): cat, dog"), std::string::npos);
}

TEST_F(ReportWriterTest, Json) {
    ReportConfig config = plain();
    config.format = ReportFormat::JSON;
    auto j = nlohmann::json::parse(ReportWriter(result).generate(config));

    EXPECT_EQ(j["corpus"], "SG_2");
    EXPECT_FALSE(j.contains("generated"));
    EXPECT_EQ(j["classes"]["num_classes"], 9);
    EXPECT_EQ(j["grammar"]["fragments"].size(), 5);
    EXPECT_EQ(j["statistics"]["substrings"], 19);
    EXPECT_TRUE(j["warnings"].empty());
}

TEST_F(ReportWriterTest, VertexLimit) {
    ReportConfig config = plain();
    config.max_vertices = 3;
    std::string report = ReportWriter(result).generate(config);
    EXPECT_NE(report.find("... and 16 more"), std::string::npos);
}

TEST(ReportWriterDegenerateTest, WarningsAreReported) {
    PipelineConfig config;
    config.verbose = false;
    config.max_length = 1;
    PipelineResult result = LearnerPipeline(config).run(
        Corpus::from_phrases("abc", {{"a", "b", "c"}}));

    ReportConfig report_config;
    report_config.include_timestamp = false;
    std::string report = ReportWriter(result).generate(report_config);

    EXPECT_NE(report.find("WARNINGS"), std::string::npos);
    EXPECT_NE(report.find("[graph]"), std::string::npos);
    EXPECT_NE(report.find("  N0 (1): {a}\n"), std::string::npos);
    EXPECT_NE(report.find("  N2 (1): {c}\n"), std::string::npos);
    EXPECT_EQ(report.find("singleton classes"), std::string::npos);

    report_config.collapse_singletons = true;
    report = ReportWriter(result).generate(report_config);
    EXPECT_NE(report.find("3 singleton classes"), std::string::npos);
    EXPECT_EQ(report.find("N0 (1): {a}"), std::string::npos);
}

TEST(ReportWriterDegenerateTest, ProductiveSingletonClassIsListed) {
    PipelineConfig config;
    config.verbose = false;
    PipelineResult result = LearnerPipeline(config).run(
        Corpus::from_phrases("shared", {{"a", "b", "c", "d"}, {"x", "b", "c", "y"}}));

    const CongruenceClass* shared = nullptr;
    for (const auto& cls : result.partition.classes()) {
        if (cls.is_singleton() && cls.members[0] == Phrase{"b", "c"}) shared = &cls;
    }
    ASSERT_NE(shared, nullptr);
    EXPECT_TRUE(result.grammar.is_productive(shared->id));

    ReportConfig report_config;
    report_config.include_timestamp = false;
    std::string report = ReportWriter(result).generate(report_config);
    std::string classes = report.substr(report.find("CONGRUENCE CLASSES"));
    classes = classes.substr(0, classes.find("GRAMMAR"));

    EXPECT_NE(classes.find(shared->nonterminal() + " (1): {b c}"), std::string::npos);

    report_config.format = ReportFormat::MARKDOWN;
    report = ReportWriter(result).generate(report_config);
    EXPECT_NE(report.find("- **" + shared->nonterminal() + "** (1): b c"), std::string::npos);
}

TEST(ReportWriterCharacterTest, CharacterCorpusJoinsWithoutSpaces) {
    PipelineConfig config;
    config.verbose = false;
    PipelineResult result = LearnerPipeline(config).run(builtin_corpora().front());

    ReportConfig report_config;
    report_config.include_timestamp = false;
    std::string report = ReportWriter(result).generate(report_config);

    EXPECT_NE(report.find("    abbcbba\n"), std::string::npos);
}

TEST(ReportWriterCharacterTest, NonAsciiCorpusProducesValidJson) {
    CorpusLoader loader(create_segmentation("line"), Granularity::CHARACTER);
    Corpus corpus = loader.load_text("caf\xC3\xA9\ncafe\n", "accents");

    PipelineConfig config;
    config.verbose = false;
    PipelineResult result = LearnerPipeline(config).run(corpus);

    ReportConfig report_config;
    report_config.include_timestamp = false;
    report_config.format = ReportFormat::JSON;
    std::string report;
    ASSERT_NO_THROW(report = ReportWriter(result).generate(report_config));

    auto j = nlohmann::json::parse(report);
    EXPECT_EQ(j["statistics"]["sentences"], 2);
    auto alphabet = j["grammar"]["alphabet"].get<std::vector<std::string>>();
    EXPECT_NE(std::find(alphabet.begin(), alphabet.end(), "\xC3\xA9"), alphabet.end());
}

// ==========================================
// File Tests
// ==========================================

TEST_F(ReportWriterTest, SaveToFile) {
    fs::path path = fs::temp_directory_path() / "slg_report_writer_test.txt";
    ReportWriter::save_to_file(path.string(), "report body\n");

    std::ifstream file(path);
    std::stringstream content;
    content << file.rdbuf();
    fs::remove(path);

    EXPECT_EQ(content.str(), "report body\n");
    EXPECT_THROW(ReportWriter::save_to_file("/nonexistent/dir/report.txt", "x"), InputError);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
