#include "cli/commands.hpp"
#include "corpus/corpus_loader.hpp"
#include "pipeline/learner_pipeline.hpp"
#include "render/graph_renderer.hpp"
#include "report/report_writer.hpp"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

using namespace slg;

// Default report name: slg_report_<HH_MM_SS>.txt
std::string default_report_path() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << "slg_report_" << std::put_time(std::localtime(&time), "%H_%M_%S") << ".txt";
    return ss.str();
}

// Same directory and stem as the report, renderer's extension
std::string render_path_for(const std::string& report_path, const GraphRenderer& renderer) {
    fs::path p(report_path);
    p.replace_extension(renderer.get_extension());
    return p.string();
}

void render_graph(const PipelineResult& result, GraphRenderer& renderer,
                  const std::string& path) {
    renderer.set_title(result.corpus.name);
    renderer.set_token_separator(result.corpus.token_separator);
    renderer.render(result.graph, result.partition, path);
    std::cout << "Graph written to: " << path << "\n";
}

// Flags override whatever the config file or environment supplied
void apply_flags(const Args& args, PipelineConfig& config) {
    if (args.has("min-length")) config.min_length = args.get("min-length").as_int();
    if (args.has("max-length")) config.max_length = args.get("max-length").as_optional_int();
    if (args.has("context-width")) config.context_width = args.get("context-width").as_int();
    if (args.has("granularity")) config.granularity = args.get("granularity").value;
    if (args.has("segmentation")) config.segmentation = args.get("segmentation").value;
    if (args.has("format")) config.report_format = args.get("format").value;
    if (args.has("render-format")) config.render_format = args.get("render-format").value;
    if (args.has("visualize")) config.visualize = true;
    if (args.has("lite")) config.lite = true;
    if (args.has("quiet")) config.verbose = false;
}

}  // namespace

namespace slg {

// ============== slg learn ==============
int cmd_learn(const Args& args) {
    std::string input_path = args.require("input");
    bool print_only = args.has("print");

    PipelineConfig config = args.has("config")
        ? PipelineConfig::from_json_file(args.get("config").value)
        : PipelineConfig::from_environment();
    apply_flags(args, config);
    if (print_only) {
        // Keep stdout for the report itself
        config.verbose = false;
    }

    LearnerPipeline pipeline(config);
    if (config.verbose) {
        std::cout << "Learning from: " << input_path << "\n";
    }
    PipelineResult result = pipeline.run_path(input_path);

    if (result.stats.substrings == 0) {
        std::cerr << "Error: no substrings extracted from " << input_path
                  << "; every sentence is too short for the length policy\n";
        return 1;
    }

    std::string output_path = args.has("output") ? args.get("output").value
                                                 : default_report_path();

    ReportConfig report_config;
    report_config.title = "Substitutable Language Grammar: " + result.corpus.name;
    if (print_only && (config.report_format.empty() || config.report_format == "auto")) {
        report_config.format = ReportFormat::PLAIN_TEXT;
    } else {
        report_config.format = resolve_report_format(config.report_format, output_path);
    }

    ReportWriter writer(result);
    std::string report = writer.generate(report_config);
    if (print_only) {
        std::cout << report;
    } else {
        ReportWriter::save_to_file(output_path, report);
        std::cout << "Report written to: " << output_path << "\n";
    }

    if (config.should_render()) {
        auto renderer = create_graph_renderer(config.render_format);
        render_graph(result, *renderer, render_path_for(output_path, *renderer));
    }

    if (config.verbose) {
        result.stats.print_summary();
    }
    return 0;
}

// ============== slg demo ==============
int cmd_demo(const Args& args) {
    PipelineConfig config;
    config.verbose = false;
    apply_flags(args, config);

    LearnerPipeline pipeline(config);

    ReportConfig report_config;
    report_config.include_timestamp = false;
    report_config.format = config.report_format == "auto"
        ? ReportFormat::PLAIN_TEXT
        : parse_report_format(config.report_format);

    for (const auto& corpus : builtin_corpora()) {
        PipelineResult result = pipeline.run(corpus);

        report_config.title = corpus.name;
        if (report_config.format != ReportFormat::JSON) {
            std::cout << "\n" << std::string(79, '=') << "\n\n";
        }
        std::cout << ReportWriter(result).generate(report_config) << "\n";

        if (config.should_render()) {
            auto renderer = create_graph_renderer(config.render_format);
            render_graph(result, *renderer, corpus.name + renderer->get_extension());
        }
    }
    return 0;
}

// ============== slg config ==============
int cmd_config(const Args& args) {
    std::string output_path = args.get("output").value;

    PipelineConfig config = create_default_config();
    config.to_json_file(output_path);

    std::cout << "Default configuration written to: " << output_path << "\n";
    std::cout << "Use it with: slg learn --input <path> --config " << output_path << "\n";
    return 0;
}

// ============== Registration ==============
void register_commands(CLI& cli) {
    // slg learn
    cli.register_command({
        "learn",
        "Learn a substitutable grammar from a text file or directory",
        {
            {"input", "i", "Input text file or directory of text files", "", true, false},
            {"output", "o", "Report path (default: slg_report_<HH_MM_SS>.txt)", "", false, false},
            {"print", "p", "Print the report to stdout instead of writing a file", "", false, true},
            {"format", "f", "Report format; auto uses the output extension", "", false, false,
                {"auto", "text", "markdown", "json"}},
            {"min-length", "m", "Minimum substring length in tokens (default: 1)", "", false, false},
            {"max-length", "M", "Maximum substring length in tokens (default: sentence length - 1)", "", false, false},
            {"context-width", "w", "Context tokens kept on each side, 0 = whole sentence (default: 0)", "", false, false},
            {"granularity", "g", "Token granularity: word or character (default: word)", "", false, false},
            {"segmentation", "s", "Sentence segmentation (default: period)", "", false, false, {"period", "line"}},
            {"visualize", "v", "Render the substitution graph next to the report", "", false, true},
            {"render-format", "r", "Graph rendering (default: dot)", "", false, false, {"dot", "html"}},
            {"lite", "l", "Never render, even with --visualize", "", false, true},
            {"config", "c", "JSON configuration file; flags override its values", "", false, false},
            {"quiet", "q", "No progress output or summary", "", false, true}
        },
        cmd_learn
    });

    // slg demo
    cli.register_command({
        "demo",
        "Run the built-in toy grammar and word corpora",
        {
            {"format", "f", "Report format (default: text)", "", false, false, {"text", "markdown", "json"}},
            {"visualize", "v", "Render each substitution graph to the current directory", "", false, true},
            {"render-format", "r", "Graph rendering (default: dot)", "", false, false, {"dot", "html"}},
            {"lite", "l", "Never render, even with --visualize", "", false, true}
        },
        cmd_demo
    });

    // slg config
    cli.register_command({
        "config",
        "Write a default JSON configuration file",
        {
            {"output", "o", "Output path for the configuration", "slg_config.json", false, false}
        },
        cmd_config
    });
}

} // namespace slg
