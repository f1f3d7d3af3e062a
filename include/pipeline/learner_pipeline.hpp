#pragma once

#include "common/errors.hpp"
#include "corpus/corpus_loader.hpp"
#include "grammar/context_extractor.hpp"
#include "grammar/grammar_inducer.hpp"
#include "graph/congruence_classes.hpp"
#include "graph/substitution_graph.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace slg {

// ============================================================================
// Pipeline Configuration
// ============================================================================

/**
 * @brief Configuration for one learning run
 */
struct PipelineConfig {
    // Extraction
    int min_length = 1;                     ///< Minimum substring length (tokens)
    std::optional<int> max_length;          ///< Maximum substring length; unset = sentence length - 1
    int context_width = 0;                  ///< 0 = context extends to the sentence boundary

    // Corpus
    std::string granularity = "word";       ///< "word" or "character"
    std::string segmentation = "period";    ///< "period" or "line"

    // Grammar
    size_t min_observations = GrammarInducer::DEFAULT_MIN_OBSERVATIONS;  ///< Productive threshold

    // Output
    std::string report_format = "auto";     ///< "auto", "text", "markdown", "json"
    bool visualize = false;                 ///< Render the substitution graph
    bool lite = false;                      ///< Never create a renderer
    std::string render_format = "dot";      ///< "dot" or "html"
    bool verbose = true;                    ///< Progress output on stdout

    /**
     * @brief Load configuration from JSON file
     * @throws InputError if the file cannot be read or parsed
     */
    static PipelineConfig from_json_file(const std::string& path);

    /**
     * @brief Apply values present in a JSON object on top of this config
     */
    void merge_json(const nlohmann::json& j);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    nlohmann::json to_json() const;

    /**
     * @brief Load from SLG_* environment variables on top of the defaults
     */
    static PipelineConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    LengthPolicy length_policy() const;

    /**
     * @brief Whether a renderer should be created for this run
     */
    bool should_render() const { return visualize && !lite; }
};

// ============================================================================
// Pipeline Statistics
// ============================================================================

/**
 * @brief Statistics from pipeline execution
 */
struct PipelineStatistics {
    // Corpus
    size_t sentences = 0;
    size_t tokens = 0;

    // Extraction
    size_t substrings = 0;
    size_t occurrences = 0;
    size_t distinct_contexts = 0;

    // Graph
    size_t nodes = 0;
    size_t edges = 0;
    size_t shared_contexts = 0;

    // Classes
    size_t classes = 0;
    size_t singleton_classes = 0;
    size_t largest_class = 0;

    // Grammar
    size_t productive_fragments = 0;
    size_t unproductive_fragments = 0;
    size_t rules = 0;

    // Timing
    double extraction_time_seconds = 0.0;
    double graph_time_seconds = 0.0;
    double resolution_time_seconds = 0.0;
    double induction_time_seconds = 0.0;
    double total_time_seconds = 0.0;

    /**
     * @brief Print summary to stdout
     */
    void print_summary() const;

    nlohmann::json to_json() const;
};

// ============================================================================
// Pipeline Result
// ============================================================================

/**
 * @brief Everything one run produced; owned by the caller, never shared
 */
struct PipelineResult {
    Corpus corpus;
    ContextSet contexts;
    SubstitutionGraph graph;
    CongruencePartition partition;
    Grammar grammar;
    PipelineStatistics stats;
    std::vector<DegenerateResultWarning> warnings;

    /**
     * @brief True when no two substrings share a context
     */
    bool is_degenerate() const { return graph.num_edges() == 0; }
};

/**
 * @brief Progress callback function type
 */
using ProgressCallback = std::function<void(
    const std::string& stage,
    int current,
    int total,
    const std::string& message
)>;

// ============================================================================
// Learner Pipeline
// ============================================================================

/**
 * @brief Context extraction -> substitution graph -> classes -> grammar
 *
 * Stages run strictly in order, each consuming the full output of the
 * previous one. The pipeline keeps no state between runs.
 */
class LearnerPipeline {
public:
    /**
     * @brief Constructor
     * @throws ConfigurationError if the configuration is invalid
     */
    explicit LearnerPipeline(const PipelineConfig& config);

    /**
     * @brief Run all stages on a loaded corpus
     * @throws InputError if the corpus has no sentences
     */
    PipelineResult run(const Corpus& corpus) const;

    /**
     * @brief Load a corpus file or directory and run
     * @throws InputError for unreadable input or an empty corpus
     */
    PipelineResult run_path(const std::string& input_path) const;

    /**
     * @brief Loader configured with this pipeline's granularity and segmentation
     */
    CorpusLoader make_loader() const;

    void set_progress_callback(ProgressCallback callback);

    const PipelineConfig& get_config() const { return config_; }

private:
    PipelineConfig config_;
    ContextExtractor extractor_;
    ProgressCallback progress_callback_;

    void report_progress(const std::string& stage, int current, int total,
                         const std::string& message = "") const;

    void record_warning(PipelineResult& result, const std::string& stage,
                        const std::string& message) const;
};

/**
 * @brief Create default pipeline configuration
 */
PipelineConfig create_default_config();

} // namespace slg
