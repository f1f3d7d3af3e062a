#pragma once

#include "pipeline/learner_pipeline.hpp"
#include <string>

namespace slg {

// Report format
enum class ReportFormat {
    PLAIN_TEXT,
    MARKDOWN,
    JSON
};

/**
 * @brief Parse "text", "markdown"/"md" or "json"
 * @throws ConfigurationError for unknown names ("auto" included)
 */
ReportFormat parse_report_format(const std::string& name);

/**
 * @brief Format implied by an output path: ".json" -> JSON, ".md" -> MARKDOWN,
 *        anything else -> PLAIN_TEXT
 */
ReportFormat format_from_extension(const std::string& path);

/**
 * @brief Resolve a configured format name against the output path
 *
 * "auto" defers to the extension; any other name must parse.
 */
ReportFormat resolve_report_format(const std::string& name, const std::string& path);

// Report configuration
struct ReportConfig {
    std::string title = "Substitutable Language Grammar";
    ReportFormat format = ReportFormat::PLAIN_TEXT;
    bool include_timestamp = true;
    bool include_graph = true;          // Vertices and edges
    bool include_contexts = true;       // Contexts shared by more than one substring
    bool include_statistics = true;
    bool collapse_singletons = false;   // Count single-member classes instead of listing them
    size_t max_vertices = 0;            // 0 = list all
};

/**
 * @brief Turns one PipelineResult into a text, Markdown or JSON report
 */
class ReportWriter {
public:
    explicit ReportWriter(const PipelineResult& result);

    std::string generate(const ReportConfig& config = {}) const;

    /**
     * @brief Write a generated report
     * @throws InputError if the path cannot be written
     */
    static void save_to_file(const std::string& path, const std::string& content);

private:
    const PipelineResult& result_;

    std::string generate_json(const ReportConfig& config) const;

    // Section generators (text and Markdown)
    std::string generate_header(const ReportConfig& config) const;
    std::string generate_warnings_section(const ReportConfig& config) const;
    std::string generate_statistics_section(const ReportConfig& config) const;
    std::string generate_graph_section(const ReportConfig& config) const;
    std::string generate_contexts_section(const ReportConfig& config) const;
    std::string generate_classes_section(const ReportConfig& config) const;
    std::string generate_grammar_section(const ReportConfig& config) const;

    // Helpers
    std::string section_title(const std::string& title, const ReportConfig& config) const;
    std::string phrase_label(const Phrase& phrase) const;
    std::string member_list(const std::vector<Phrase>& members) const;
    std::string fragment_rules(const GrammarFragment& fragment, bool markdown) const;
    std::string get_current_timestamp() const;
};

} // namespace slg
