#pragma once

#include "grammar/types.hpp"
#include "grammar/context_extractor.hpp"
#include "graph/congruence_classes.hpp"
#include <map>
#include <set>
#include <string>
#include <tuple>
#include <vector>
#include <nlohmann/json.hpp>

namespace slg {

/**
 * @brief One observed (left-context, class, right-context) triple
 *
 * Read as the alternative  S -> left N<class_id> right.
 */
struct ContextPattern {
    Phrase left;
    size_t class_id = 0;
    Phrase right;

    bool operator<(const ContextPattern& other) const {
        return std::tie(left, class_id, right) <
               std::tie(other.left, other.class_id, other.right);
    }
    bool operator==(const ContextPattern& other) const {
        return left == other.left && class_id == other.class_id && right == other.right;
    }

    /**
     * @brief Render as "<s> the N3 sat </s>"
     */
    std::string to_string(const std::string& separator = " ") const;

    nlohmann::json to_json() const;
};

/**
 * @brief Binary rule N<head> -> N<left_class> N<right_class>
 */
struct DecompositionRule {
    size_t left_class = 0;
    size_t right_class = 0;

    bool operator<(const DecompositionRule& other) const {
        return std::tie(left_class, right_class) < std::tie(other.left_class, other.right_class);
    }
    bool operator==(const DecompositionRule& other) const {
        return left_class == other.left_class && right_class == other.right_class;
    }
};

/**
 * @brief Induced nonterminal for one congruence class
 */
struct GrammarFragment {
    size_t class_id = 0;
    std::string nonterminal;
    std::vector<Phrase> members;

    std::set<ContextPattern> patterns;          // S -> left N right
    std::set<std::string> lexical_rules;        // N -> a
    std::set<DecompositionRule> decompositions; // N -> Nj Nk

    size_t occurrences = 0;     // Member occurrences found in the corpus
    bool productive = false;    // At least the minimum number of distinct patterns

    size_t num_observations() const { return patterns.size(); }
    size_t num_rules() const {
        return patterns.size() + lexical_rules.size() + decompositions.size();
    }

    nlohmann::json to_json() const;
};

/**
 * @brief G = <Sigma, V, P, S> restricted to the productive classes
 */
struct Grammar {
    std::string name;
    std::string start_symbol = "S";
    std::set<std::string> alphabet;             // Terminal tokens
    std::vector<std::string> nonterminals;      // One per congruence class
    std::vector<Phrase> start_strings;          // Distinct corpus sentences

    std::map<size_t, GrammarFragment> fragments;     // Productive, keyed by class id
    std::map<size_t, GrammarFragment> unproductive;  // Insufficiently attested

    /**
     * @brief Fragment of a class, productive or not; nullptr if unknown
     */
    const GrammarFragment* fragment(size_t class_id) const;

    bool is_productive(size_t class_id) const { return fragments.count(class_id) > 0; }

    /**
     * @brief Total rule count over productive fragments
     */
    size_t num_rules() const;

    nlohmann::json to_json() const;
};

/**
 * @brief Derives grammar fragments from the corpus and its congruence classes
 *
 * For every sentence and every span the extractor would consider, a span
 * that is a class member contributes its context as a pattern of that class.
 * Lexical and binary decomposition rules come from the class members
 * themselves: a one-token member a gives N -> a, and each split u = v w of a
 * longer member whose halves are both classified gives N -> class(v) class(w).
 */
class GrammarInducer {
public:
    static constexpr size_t DEFAULT_MIN_OBSERVATIONS = 2;

    explicit GrammarInducer(const ContextExtractor& extractor,
                            size_t min_observations = DEFAULT_MIN_OBSERVATIONS);

    Grammar induce(const Corpus& corpus, const CongruencePartition& partition) const;

    size_t min_observations() const { return min_observations_; }

private:
    ContextExtractor extractor_;
    size_t min_observations_;

    void collect_patterns(const Corpus& corpus,
                          const CongruencePartition& partition,
                          std::vector<GrammarFragment>& fragments) const;

    void collect_member_rules(const CongruencePartition& partition,
                              std::vector<GrammarFragment>& fragments) const;
};

} // namespace slg
