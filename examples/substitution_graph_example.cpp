#include "corpus/corpus_loader.hpp"
#include "grammar/context_extractor.hpp"
#include "grammar/grammar_inducer.hpp"
#include "graph/congruence_classes.hpp"
#include "graph/substitution_graph.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace slg;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

int main() {
    print_separator("Substitution Graph Example - Step by Step");

    const std::string output_dir = "output_json";
    std::filesystem::create_directories(output_dir);

    Corpus corpus = Corpus::from_phrases("SG_2", {
        {"the", "dog", "ran"},
        {"the", "cat", "ran"},
        {"the", "cat", "quickly", "walked"},
        {"the", "cat", "slowly", "walked"}
    });

    std::cout << "Corpus:\n";
    for (const auto& sentence : corpus.sentences) {
        std::cout << "  " << join_phrase(sentence.tokens) << "\n";
    }

    // Step 1: every substring and the contexts it appears in
    print_separator("1. Contexts");
    ContextExtractor extractor;
    ContextSet contexts = extractor.extract(corpus);
    std::cout << contexts.num_substrings() << " substrings, "
              << contexts.num_occurrences() << " occurrences, "
              << contexts.num_distinct_contexts() << " distinct contexts\n\n";

    for (const Phrase& phrase : {Phrase{"cat"}, Phrase{"dog"}}) {
        std::cout << "  " << join_phrase(phrase) << ":\n";
        for (const auto& context : *contexts.contexts_of(phrase)) {
            std::cout << "    " << context.to_string() << "\n";
        }
    }

    // Step 2: link substrings that share a context
    print_separator("2. Substitution Graph");
    SubstitutionGraph graph = SubstitutionGraphBuilder().build(contexts);
    GraphStatistics stats = graph.compute_statistics();
    std::cout << "Nodes: " << stats.num_nodes << "\n";
    std::cout << "Edges: " << stats.num_edges << "\n";
    std::cout << "Shared contexts: " << stats.num_shared_contexts << "\n";
    std::cout << "Isolated nodes: " << stats.num_isolated_nodes << "\n\n";

    for (const auto& edge : graph.edges()) {
        std::cout << "  " << join_phrase(graph.node(edge.first)) << " -- "
                  << join_phrase(graph.node(edge.second)) << "  "
                  << graph.witness(edge).to_string() << "\n";
    }

    // Step 3: connected components are the congruence classes
    print_separator("3. Congruence Classes");
    CongruencePartition partition = CongruenceClassResolver().resolve(graph);
    for (const auto& cls : partition.classes()) {
        std::cout << "  " << cls.nonterminal() << ":";
        for (const auto& member : cls.members) {
            std::cout << " [" << join_phrase(member) << "]";
        }
        std::cout << "\n";
    }

    std::cout << "\ncat ~ dog: " << (partition.same_class({"cat"}, {"dog"}) ? "yes" : "no") << "\n";
    std::cout << "cat ~ quickly: " << (partition.same_class({"cat"}, {"quickly"}) ? "yes" : "no") << "\n";

    // Step 4: rules from the classes
    print_separator("4. Grammar");
    Grammar grammar = GrammarInducer(extractor).induce(corpus, partition);
    std::cout << "Productive nonterminals: " << grammar.fragments.size() << "\n";
    std::cout << "Insufficiently attested: " << grammar.unproductive.size() << "\n";
    std::cout << "Rules: " << grammar.num_rules() << "\n\n";

    for (const auto& [id, fragment] : grammar.fragments) {
        for (const auto& pattern : fragment.patterns) {
            std::cout << "  " << grammar.start_symbol << " -> " << pattern.to_string() << "\n";
        }
        for (const auto& terminal : fragment.lexical_rules) {
            std::cout << "  " << fragment.nonterminal << " -> " << terminal << "\n";
        }
    }

    // Export
    print_separator("Export");
    const std::string graph_path = output_dir + "/substitution_graph.json";
    std::ofstream graph_file(graph_path);
    graph_file << graph.to_json().dump(2);
    std::cout << "Saved graph to " << graph_path << "\n";

    const std::string grammar_path = output_dir + "/grammar.json";
    std::ofstream grammar_file(grammar_path);
    grammar_file << grammar.to_json().dump(2);
    std::cout << "Saved grammar to " << grammar_path << "\n";

    return 0;
}
