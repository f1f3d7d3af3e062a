#include "pipeline/learner_pipeline.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace {

const slg::PipelineConfig& require_valid(const slg::PipelineConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw slg::ConfigurationError("Invalid configuration: " + error);
    }
    return config;
}

int parse_int_variable(const char* name, const char* value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw slg::ConfigurationError(std::string(name) + " must be an integer, got '" +
                                      value + "'");
    }
}

double seconds_since(std::chrono::high_resolution_clock::time_point start) {
    return std::chrono::duration<double>(
        std::chrono::high_resolution_clock::now() - start
    ).count();
}

}  // namespace

namespace slg {

// ============================================================================
// PipelineConfig
// ============================================================================

PipelineConfig PipelineConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw InputError("Failed to open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw InputError("Failed to parse config file " + path + ": " + e.what());
    }

    PipelineConfig config;
    config.merge_json(j);
    return config;
}

void PipelineConfig::merge_json(const json& j) {
    try {
        // Extraction config
        if (j.contains("min_length")) min_length = j["min_length"];
        if (j.contains("max_length")) {
            if (j["max_length"].is_null()) {
                max_length.reset();
            } else {
                max_length = j["max_length"].get<int>();
            }
        }
        if (j.contains("context_width")) context_width = j["context_width"];

        // Corpus config
        if (j.contains("granularity")) granularity = j["granularity"];
        if (j.contains("segmentation")) segmentation = j["segmentation"];

        // Grammar config
        if (j.contains("min_observations")) {
            long long observations = j["min_observations"].get<long long>();
            if (observations <= 0) {
                throw ConfigurationError("min_observations must be >= 1, got " +
                                         std::to_string(observations));
            }
            min_observations = static_cast<size_t>(observations);
        }

        // Output config
        if (j.contains("report_format")) report_format = j["report_format"];
        if (j.contains("visualize")) visualize = j["visualize"];
        if (j.contains("lite")) lite = j["lite"];
        if (j.contains("render_format")) render_format = j["render_format"];
        if (j.contains("verbose")) verbose = j["verbose"];
    } catch (const json::type_error& e) {
        throw ConfigurationError(std::string("Invalid value type in configuration: ") + e.what());
    }
}

json PipelineConfig::to_json() const {
    json j;

    j["min_length"] = min_length;
    if (max_length.has_value()) {
        j["max_length"] = *max_length;
    } else {
        j["max_length"] = nullptr;
    }
    j["context_width"] = context_width;

    j["granularity"] = granularity;
    j["segmentation"] = segmentation;

    j["min_observations"] = min_observations;

    j["report_format"] = report_format;
    j["visualize"] = visualize;
    j["lite"] = lite;
    j["render_format"] = render_format;
    j["verbose"] = verbose;

    return j;
}

void PipelineConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw InputError("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2) << "\n";
}

PipelineConfig PipelineConfig::from_environment() {
    PipelineConfig config;

    const char* min_length = std::getenv("SLG_MIN_LENGTH");
    if (min_length) config.min_length = parse_int_variable("SLG_MIN_LENGTH", min_length);

    const char* max_length = std::getenv("SLG_MAX_LENGTH");
    if (max_length) config.max_length = parse_int_variable("SLG_MAX_LENGTH", max_length);

    const char* context_width = std::getenv("SLG_CONTEXT_WIDTH");
    if (context_width) {
        config.context_width = parse_int_variable("SLG_CONTEXT_WIDTH", context_width);
    }

    const char* granularity = std::getenv("SLG_GRANULARITY");
    if (granularity) config.granularity = granularity;

    return config;
}

bool PipelineConfig::validate(std::string& error_message) const {
    if (min_length <= 0) {
        error_message = "Minimum substring length must be positive";
        return false;
    }

    if (max_length.has_value() && *max_length <= 0) {
        error_message = "Maximum substring length must be positive";
        return false;
    }

    if (max_length.has_value() && min_length > *max_length) {
        error_message = "Minimum substring length (" + std::to_string(min_length) +
                        ") is greater than maximum (" + std::to_string(*max_length) + ")";
        return false;
    }

    if (context_width < 0) {
        error_message = "Context width must not be negative";
        return false;
    }

    try {
        parse_granularity(granularity);
    } catch (const ConfigurationError& e) {
        error_message = e.what();
        return false;
    }

    if (segmentation != "period" && segmentation != "line") {
        error_message = "Segmentation must be 'period' or 'line', got '" + segmentation + "'";
        return false;
    }

    if (min_observations == 0) {
        error_message = "Minimum observations for a productive class must be positive";
        return false;
    }

    if (report_format != "auto" && report_format != "text" &&
        report_format != "markdown" && report_format != "json") {
        error_message = "Invalid report format: " + report_format;
        return false;
    }

    if (render_format != "dot" && render_format != "html") {
        error_message = "Invalid render format: " + render_format;
        return false;
    }

    return true;
}

LengthPolicy PipelineConfig::length_policy() const {
    LengthPolicy policy;
    policy.min_length = min_length;
    policy.max_length = max_length;
    return policy;
}

// ============================================================================
// PipelineStatistics
// ============================================================================

void PipelineStatistics::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Learning Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Corpus:\n";
    std::cout << "  Sentences: " << sentences << "\n";
    std::cout << "  Tokens: " << tokens << "\n\n";

    std::cout << "Context Extraction:\n";
    std::cout << "  Distinct substrings: " << substrings << "\n";
    std::cout << "  Occurrences: " << occurrences << "\n";
    std::cout << "  Distinct contexts: " << distinct_contexts << "\n\n";

    std::cout << "Substitution Graph:\n";
    std::cout << "  Nodes: " << nodes << "\n";
    std::cout << "  Edges: " << edges << "\n";
    std::cout << "  Shared contexts: " << shared_contexts << "\n\n";

    std::cout << "Congruence Classes:\n";
    std::cout << "  Classes: " << classes << "\n";
    std::cout << "  Singletons: " << singleton_classes << "\n";
    std::cout << "  Largest class: " << largest_class << "\n\n";

    std::cout << "Grammar:\n";
    std::cout << "  Productive fragments: " << productive_fragments << "\n";
    std::cout << "  Insufficiently attested: " << unproductive_fragments << "\n";
    std::cout << "  Rules: " << rules << "\n\n";

    std::cout << "Timing:\n";
    std::cout << "  Extraction: " << extraction_time_seconds << " seconds\n";
    std::cout << "  Graph building: " << graph_time_seconds << " seconds\n";
    std::cout << "  Class resolution: " << resolution_time_seconds << " seconds\n";
    std::cout << "  Grammar induction: " << induction_time_seconds << " seconds\n";
    std::cout << "  Total: " << total_time_seconds << " seconds\n";

    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

json PipelineStatistics::to_json() const {
    json j;

    j["sentences"] = sentences;
    j["tokens"] = tokens;

    j["substrings"] = substrings;
    j["occurrences"] = occurrences;
    j["distinct_contexts"] = distinct_contexts;

    j["nodes"] = nodes;
    j["edges"] = edges;
    j["shared_contexts"] = shared_contexts;

    j["classes"] = classes;
    j["singleton_classes"] = singleton_classes;
    j["largest_class"] = largest_class;

    j["productive_fragments"] = productive_fragments;
    j["unproductive_fragments"] = unproductive_fragments;
    j["rules"] = rules;

    j["extraction_time_seconds"] = extraction_time_seconds;
    j["graph_time_seconds"] = graph_time_seconds;
    j["resolution_time_seconds"] = resolution_time_seconds;
    j["induction_time_seconds"] = induction_time_seconds;
    j["total_time_seconds"] = total_time_seconds;

    return j;
}

// ============================================================================
// LearnerPipeline
// ============================================================================

LearnerPipeline::LearnerPipeline(const PipelineConfig& config)
    : config_(require_valid(config)),
      extractor_(config.length_policy(), config.context_width) {}

CorpusLoader LearnerPipeline::make_loader() const {
    CorpusLoader loader(create_segmentation(config_.segmentation),
                        parse_granularity(config_.granularity));
    loader.set_verbose(config_.verbose);
    return loader;
}

PipelineResult LearnerPipeline::run_path(const std::string& input_path) const {
    report_progress("Loading", 0, 1, input_path);
    Corpus corpus = make_loader().load(input_path);
    return run(corpus);
}

PipelineResult LearnerPipeline::run(const Corpus& corpus) const {
    if (corpus.empty()) {
        throw InputError("Corpus '" + corpus.name + "' contains no sentences");
    }

    auto start_time = std::chrono::high_resolution_clock::now();
    PipelineResult result;
    result.corpus = corpus;
    result.stats.sentences = corpus.size();
    result.stats.tokens = corpus.num_tokens();

    // Stage 1: contexts
    report_progress("Extracting contexts", 1, 4, std::to_string(corpus.size()) + " sentences");
    auto stage_start = std::chrono::high_resolution_clock::now();
    result.contexts = extractor_.extract(corpus);
    result.stats.extraction_time_seconds = seconds_since(stage_start);
    result.stats.substrings = result.contexts.num_substrings();
    result.stats.occurrences = result.contexts.num_occurrences();
    result.stats.distinct_contexts = result.contexts.num_distinct_contexts();

    if (result.contexts.empty()) {
        record_warning(result, "extraction",
                       "No substrings extracted; every sentence is shorter than the "
                       "length policy allows");
    }

    // Stage 2: substitution graph
    report_progress("Building substitution graph", 2, 4,
                    std::to_string(result.stats.substrings) + " substrings");
    stage_start = std::chrono::high_resolution_clock::now();
    result.graph = SubstitutionGraphBuilder().build(result.contexts);
    result.stats.graph_time_seconds = seconds_since(stage_start);
    auto graph_stats = result.graph.compute_statistics();
    result.stats.nodes = graph_stats.num_nodes;
    result.stats.edges = graph_stats.num_edges;
    result.stats.shared_contexts = graph_stats.num_shared_contexts;

    if (result.graph.num_edges() == 0) {
        record_warning(result, "graph",
                       "Substitution graph has no edges; no two substrings share a context "
                       "and every congruence class is a singleton");
    }

    // Stage 3: congruence classes
    report_progress("Resolving congruence classes", 3, 4,
                    std::to_string(result.stats.edges) + " edges");
    stage_start = std::chrono::high_resolution_clock::now();
    result.partition = CongruenceClassResolver().resolve(result.graph);
    result.stats.resolution_time_seconds = seconds_since(stage_start);
    result.stats.classes = result.partition.size();
    result.stats.singleton_classes = result.partition.singleton_count();
    result.stats.largest_class = result.partition.largest_class_size();

    // Stage 4: grammar
    report_progress("Inducing grammar", 4, 4,
                    std::to_string(result.stats.classes) + " classes");
    stage_start = std::chrono::high_resolution_clock::now();
    result.grammar = GrammarInducer(extractor_, config_.min_observations)
                         .induce(corpus, result.partition);
    result.stats.induction_time_seconds = seconds_since(stage_start);
    result.stats.productive_fragments = result.grammar.fragments.size();
    result.stats.unproductive_fragments = result.grammar.unproductive.size();
    result.stats.rules = result.grammar.num_rules();

    result.stats.total_time_seconds = seconds_since(start_time);
    return result;
}

void LearnerPipeline::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

void LearnerPipeline::report_progress(const std::string& stage, int current, int total,
                                      const std::string& message) const {
    if (progress_callback_) {
        progress_callback_(stage, current, total, message);
    }

    if (config_.verbose) {
        std::cout << "[" << current << "/" << total << "] " << stage;
        if (!message.empty()) {
            std::cout << ": " << message;
        }
        std::cout << std::endl;
    }
}

void LearnerPipeline::record_warning(PipelineResult& result, const std::string& stage,
                                     const std::string& message) const {
    result.warnings.push_back(DegenerateResultWarning{stage, message});
    std::cerr << "Warning: " << message << "\n";
}

// ============================================================================
// Utility Functions
// ============================================================================

PipelineConfig create_default_config() {
    return PipelineConfig{};
}

} // namespace slg
