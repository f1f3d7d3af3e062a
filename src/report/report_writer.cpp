#include "report/report_writer.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace slg {

ReportFormat parse_report_format(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lowered == "text" || lowered == "txt") return ReportFormat::PLAIN_TEXT;
    if (lowered == "markdown" || lowered == "md") return ReportFormat::MARKDOWN;
    if (lowered == "json") return ReportFormat::JSON;
    throw ConfigurationError("Unknown report format: " + name +
                             " (expected 'text', 'markdown' or 'json')");
}

ReportFormat format_from_extension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (ext == ".json") return ReportFormat::JSON;
    if (ext == ".md" || ext == ".markdown") return ReportFormat::MARKDOWN;
    return ReportFormat::PLAIN_TEXT;
}

ReportFormat resolve_report_format(const std::string& name, const std::string& path) {
    if (name.empty() || name == "auto") {
        return format_from_extension(path);
    }
    return parse_report_format(name);
}

ReportWriter::ReportWriter(const PipelineResult& result)
    : result_(result) {}

std::string ReportWriter::get_current_timestamp() const {
    auto now = std::time(nullptr);
    std::stringstream ss;
    ss << std::put_time(std::gmtime(&now), "%Y-%m-%d %H:%M:%S UTC");
    return ss.str();
}

std::string ReportWriter::phrase_label(const Phrase& phrase) const {
    return join_phrase(phrase, result_.corpus.token_separator);
}

std::string ReportWriter::member_list(const std::vector<Phrase>& members) const {
    std::string list;
    for (size_t i = 0; i < members.size(); ++i) {
        if (i > 0) list += ", ";
        list += phrase_label(members[i]);
    }
    return list;
}

std::string ReportWriter::section_title(const std::string& title, const ReportConfig& config) const {
    std::stringstream ss;
    if (config.format == ReportFormat::MARKDOWN) {
        ss << "## " << title << "\n\n";
    } else {
        std::string upper = title;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return std::toupper(c); });
        ss << upper << "\n";
        ss << std::string(upper.length(), '-') << "\n";
    }
    return ss.str();
}

std::string ReportWriter::generate(const ReportConfig& config) const {
    if (config.format == ReportFormat::JSON) {
        return generate_json(config);
    }

    std::stringstream report;
    report << generate_header(config);
    report << generate_warnings_section(config);
    report << generate_statistics_section(config);
    report << generate_graph_section(config);
    report << generate_contexts_section(config);
    report << generate_classes_section(config);
    report << generate_grammar_section(config);
    return report.str();
}

std::string ReportWriter::generate_json(const ReportConfig& config) const {
    nlohmann::json j;
    j["title"] = config.title;
    if (config.include_timestamp) {
        j["generated"] = get_current_timestamp();
    }
    j["corpus"] = result_.corpus.name;

    nlohmann::json warnings_json = nlohmann::json::array();
    for (const auto& warning : result_.warnings) {
        nlohmann::json w;
        w["stage"] = warning.stage;
        w["message"] = warning.message;
        warnings_json.push_back(w);
    }
    j["warnings"] = warnings_json;

    if (config.include_statistics) {
        j["statistics"] = result_.stats.to_json();
    }
    if (config.include_graph) {
        j["graph"] = result_.graph.to_json();
    }
    j["classes"] = result_.partition.to_json();
    j["grammar"] = result_.grammar.to_json();
    return j.dump(2);
}

std::string ReportWriter::generate_header(const ReportConfig& config) const {
    std::stringstream ss;

    if (config.format == ReportFormat::MARKDOWN) {
        ss << "# " << config.title << "\n\n";
        if (config.include_timestamp) {
            ss << "**Generated:** " << get_current_timestamp() << "  \n";
        }
        ss << "**Corpus:** " << result_.corpus.name << "  \n";
        ss << "**Sentences:** " << result_.corpus.size() << "  \n";
        ss << "\n---\n\n";
    } else {
        ss << config.title << "\n";
        ss << std::string(config.title.length(), '=') << "\n\n";
        if (config.include_timestamp) {
            ss << "Generated: " << get_current_timestamp() << "\n";
        }
        ss << "Corpus: " << result_.corpus.name << "\n";
        ss << "Sentences: " << result_.corpus.size() << "\n\n";
    }

    return ss.str();
}

std::string ReportWriter::generate_warnings_section(const ReportConfig& config) const {
    if (result_.warnings.empty()) return "";

    std::stringstream ss;
    ss << section_title("Warnings", config);
    for (const auto& warning : result_.warnings) {
        ss << "- [" << warning.stage << "] " << warning.message << "\n";
    }
    ss << "\n";
    return ss.str();
}

std::string ReportWriter::generate_statistics_section(const ReportConfig& config) const {
    if (!config.include_statistics) return "";

    const PipelineStatistics& stats = result_.stats;
    std::vector<std::pair<std::string, std::string>> rows = {
        {"Tokens", std::to_string(stats.tokens)},
        {"Distinct substrings", std::to_string(stats.substrings)},
        {"Distinct contexts", std::to_string(stats.distinct_contexts)},
        {"Graph edges", std::to_string(stats.edges)},
        {"Shared contexts", std::to_string(stats.shared_contexts)},
        {"Congruence classes", std::to_string(stats.classes)},
        {"Singleton classes", std::to_string(stats.singleton_classes)},
        {"Largest class", std::to_string(stats.largest_class)},
        {"Productive nonterminals", std::to_string(stats.productive_fragments)},
        {"Rules", std::to_string(stats.rules)}
    };

    std::stringstream ss;
    ss << section_title("Statistics", config);
    if (config.format == ReportFormat::MARKDOWN) {
        ss << "| Metric | Value |\n";
        ss << "|--------|-------|\n";
        for (const auto& [metric, value] : rows) {
            ss << "| " << metric << " | " << value << " |\n";
        }
    } else {
        for (const auto& [metric, value] : rows) {
            ss << metric << ": " << value << "\n";
        }
    }
    ss << "\n";
    return ss.str();
}

std::string ReportWriter::generate_graph_section(const ReportConfig& config) const {
    if (!config.include_graph) return "";

    const SubstitutionGraph& graph = result_.graph;
    const bool markdown = config.format == ReportFormat::MARKDOWN;
    std::stringstream ss;

    ss << section_title("Vertices", config);
    size_t limit = config.max_vertices == 0 ? graph.num_nodes()
                                            : std::min(config.max_vertices, graph.num_nodes());
    for (size_t i = 0; i < limit; ++i) {
        ss << (markdown ? "- `" : "  ") << phrase_label(graph.node(i)) << (markdown ? "`\n" : "\n");
    }
    if (limit < graph.num_nodes()) {
        ss << (markdown ? "- " : "  ") << "... and " << (graph.num_nodes() - limit) << " more\n";
    }
    ss << "\n";

    ss << section_title("Edges", config);
    if (graph.num_edges() == 0) {
        ss << "(none)\n";
    }
    for (const auto& edge : graph.edges()) {
        std::string line = phrase_label(graph.node(edge.first)) + " -- " +
                           phrase_label(graph.node(edge.second)) + "  " +
                           graph.witness(edge).to_string(result_.corpus.token_separator);
        ss << (markdown ? "- `" : "  ") << line << (markdown ? "`\n" : "\n");
    }
    ss << "\n";
    return ss.str();
}

std::string ReportWriter::generate_contexts_section(const ReportConfig& config) const {
    if (!config.include_contexts) return "";

    const bool markdown = config.format == ReportFormat::MARKDOWN;
    const std::string& separator = result_.corpus.token_separator;
    std::stringstream ss;
    ss << section_title("Shared Contexts", config);

    size_t shown = 0;
    for (const auto& [context, node_indices] : result_.graph.context_index()) {
        if (node_indices.size() < 2) continue;
        std::string members;
        for (size_t i = 0; i < node_indices.size(); ++i) {
            if (i > 0) members += ", ";
            members += phrase_label(result_.graph.node(node_indices[i]));
        }
        if (markdown) {
            ss << "- `" << context.to_string(separator) << "`: " << members << "\n";
        } else {
            ss << "  " << context.to_string(separator) << " : " << members << "\n";
        }
        shown++;
    }
    if (shown == 0) {
        ss << "(none)\n";
    }
    ss << "\n";
    return ss.str();
}

std::string ReportWriter::generate_classes_section(const ReportConfig& config) const {
    const bool markdown = config.format == ReportFormat::MARKDOWN;
    std::stringstream ss;
    ss << section_title("Congruence Classes", config);

    for (const auto& cls : result_.partition.classes()) {
        if (config.collapse_singletons && cls.is_singleton()) continue;
        std::string members = member_list(cls.members);
        if (markdown) {
            ss << "- **" << cls.nonterminal() << "** (" << cls.size() << "): " << members << "\n";
        } else {
            ss << "  " << cls.nonterminal() << " (" << cls.size() << "): {" << members << "}\n";
        }
    }

    size_t singletons = result_.partition.singleton_count();
    if (config.collapse_singletons && singletons > 0) {
        ss << (markdown ? "- " : "  ") << singletons << " singleton classes\n";
    }
    ss << "\n";
    return ss.str();
}

std::string ReportWriter::fragment_rules(const GrammarFragment& fragment, bool markdown) const {
    const std::string& separator = result_.corpus.token_separator;
    const std::string& start = result_.grammar.start_symbol;
    std::vector<std::string> lines;

    for (const auto& pattern : fragment.patterns) {
        lines.push_back(start + " -> " + pattern.to_string(separator));
    }
    for (const auto& terminal : fragment.lexical_rules) {
        lines.push_back(fragment.nonterminal + " -> " + terminal);
    }
    for (const auto& rule : fragment.decompositions) {
        lines.push_back(fragment.nonterminal + " -> N" + std::to_string(rule.left_class) +
                        " N" + std::to_string(rule.right_class));
    }

    std::stringstream ss;
    for (const auto& line : lines) {
        ss << (markdown ? "- `" : "    ") << line << (markdown ? "`\n" : "\n");
    }
    return ss.str();
}

std::string ReportWriter::generate_grammar_section(const ReportConfig& config) const {
    const Grammar& grammar = result_.grammar;
    const bool markdown = config.format == ReportFormat::MARKDOWN;
    std::stringstream ss;

    ss << section_title("Grammar", config);

    ss << (markdown ? "**Alphabet:** " : "Alphabet: ") << "{";
    bool first = true;
    for (const auto& terminal : grammar.alphabet) {
        if (!first) ss << ", ";
        ss << terminal;
        first = false;
    }
    ss << "}\n";
    if (markdown) ss << "\n";

    ss << (markdown ? "**Nonterminals:** " : "Nonterminals: ");
    for (const auto& [id, fragment] : grammar.fragments) {
        ss << fragment.nonterminal << " ";
    }
    ss << "(" << grammar.fragments.size() << " of " << grammar.nonterminals.size() << " classes)\n";
    if (markdown) ss << "\n";

    ss << (markdown ? "**Start symbol:** " : "Start symbol: ") << grammar.start_symbol << "\n\n";

    ss << (markdown ? "### Start Strings\n\n" : "Start strings:\n");
    for (const auto& sentence : grammar.start_strings) {
        ss << (markdown ? "- " : "    ") << phrase_label(sentence) << "\n";
    }
    ss << "\n";

    ss << (markdown ? "### Rules\n\n" : "Rules:\n");
    if (grammar.fragments.empty()) {
        ss << (markdown ? "" : "    ") << "(none)\n";
    }
    for (const auto& [id, fragment] : grammar.fragments) {
        if (markdown) {
            ss << "#### " << fragment.nonterminal << "\n\n";
        } else {
            ss << "  " << fragment.nonterminal << ":\n";
        }
        ss << fragment_rules(fragment, markdown);
        if (markdown) ss << "\n";
    }
    ss << "\n";

    if (!grammar.unproductive.empty()) {
        ss << (markdown ? "### Insufficiently Attested\n\n" : "Insufficiently attested:\n");
        for (const auto& [id, fragment] : grammar.unproductive) {
            ss << (markdown ? "- " : "    ") << fragment.nonterminal << " {"
               << member_list(fragment.members) << "}: "
               << fragment.num_observations() << " context pattern"
               << (fragment.num_observations() == 1 ? "" : "s") << "\n";
        }
        ss << "\n";
    }

    return ss.str();
}

void ReportWriter::save_to_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw InputError("Cannot open file for writing: " + path);
    }
    file << content;
    file.close();
}

} // namespace slg
