#include "pipeline/learner_pipeline.hpp"
#include "report/report_writer.hpp"
#include <iostream>

using namespace slg;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

// One line per stage with a small progress bar
void progress_handler(const std::string& stage, int current, int total,
                      const std::string& message) {
    const int width = 20;
    int filled = total > 0 ? (current * width) / total : width;
    std::cout << "[" << std::string(filled, '#') << std::string(width - filled, '.') << "] "
              << stage;
    if (!message.empty()) {
        std::cout << " (" << message << ")";
    }
    std::cout << "\n";
}

int main(int argc, char* argv[]) {
    print_separator("End-to-End Grammar Learning Pipeline");

    std::cout << "This example demonstrates the complete pipeline:\n";
    std::cout << "  Corpus -> Contexts -> Substitution Graph -> Classes -> Grammar\n\n";

    print_separator("Step 1: Configuration");

    PipelineConfig config;
    int next_arg = 1;

    try {
        if (argc > 1 && std::string(argv[1]) == "--config") {
            if (argc < 3) {
                std::cerr << "Usage: " << argv[0] << " --config <config.json> [corpus]\n";
                return 1;
            }
            std::cout << "Loading configuration from: " << argv[2] << "\n";
            config = PipelineConfig::from_json_file(argv[2]);
            next_arg = 3;
        } else {
            std::cout << "Loading configuration from SLG_* environment variables...\n";
            config = PipelineConfig::from_environment();
        }
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    std::string error;
    if (!config.validate(error)) {
        std::cerr << "Configuration error: " << error << "\n\n";
        create_default_config().to_json_file("example_slg_config.json");
        std::cout << "Saved example config to: example_slg_config.json\n";
        std::cout << "  Edit this file and run: " << argv[0] << " --config example_slg_config.json\n\n";
        return 1;
    }

    std::cout << "Configuration validated\n";
    std::cout << "  Length: " << config.min_length << " to "
              << (config.max_length ? std::to_string(*config.max_length) : "sentence length - 1") << "\n";
    std::cout << "  Context width: " << config.context_width << "\n";
    std::cout << "  Granularity: " << config.granularity << "\n";

    print_separator("Step 2: Initialize Pipeline");

    config.verbose = false;
    LearnerPipeline pipeline(config);
    pipeline.set_progress_callback(progress_handler);

    std::cout << "Pipeline initialized\n";

    print_separator("Step 3: Learn");

    PipelineResult result;
    try {
        if (next_arg < argc) {
            std::cout << "Learning from: " << argv[next_arg] << "\n\n";
            result = pipeline.run_path(argv[next_arg]);
        } else {
            std::cout << "No corpus given, using the built-in SG_2 corpus\n\n";
            result = pipeline.run(builtin_corpora().back());
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    for (const auto& warning : result.warnings) {
        std::cerr << "Warning [" << warning.stage << "]: " << warning.message << "\n";
    }

    print_separator("Step 4: Results");

    result.stats.print_summary();

    ReportConfig report_config;
    report_config.include_graph = false;
    report_config.include_contexts = false;
    std::cout << ReportWriter(result).generate(report_config);

    const std::string report_path = "example_grammar.json";
    report_config.format = ReportFormat::JSON;
    ReportWriter::save_to_file(report_path, ReportWriter(result).generate(report_config));
    std::cout << "Saved JSON report to: " << report_path << "\n";

    return 0;
}
