#pragma once

#include "grammar/types.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace slg {

/**
 * @brief Inclusive bounds on substring length, in tokens
 *
 * An unset max_length means "sentence length minus 1". The whole sentence is
 * never a substring regardless of the bounds.
 */
struct LengthPolicy {
    int min_length = 1;
    std::optional<int> max_length;

    /**
     * @brief Validate bounds
     * @throws ConfigurationError on non-positive values or min > max
     */
    void validate() const;

    /**
     * @brief Whether a span of this length is extracted from a sentence of this size
     */
    bool accepts(size_t span_length, size_t sentence_length) const;

    nlohmann::json to_json() const;
};

/**
 * @brief Phrase -> set of contexts it occurs in, plus its occurrences
 *
 * Every occurrence of the same literal phrase contributes to the same entry.
 * Contexts are deduplicated by value; occurrences are not.
 */
class ContextSet {
public:
    ContextSet() = default;

    /**
     * @brief Build directly from phrase -> contexts entries (no occurrences)
     */
    explicit ContextSet(std::map<Phrase, std::set<Context>> entries);

    /**
     * @brief Record one occurrence of a phrase in a context
     */
    void add(const Phrase& phrase, const Context& context, const Occurrence& occurrence);

    /**
     * @brief Contexts of a phrase, or nullptr if it was never seen
     */
    const std::set<Context>* contexts_of(const Phrase& phrase) const;

    /**
     * @brief Occurrences of a phrase (empty if unknown)
     */
    const std::vector<Occurrence>& occurrences_of(const Phrase& phrase) const;

    bool contains(const Phrase& phrase) const { return entries_.count(phrase) > 0; }

    const std::map<Phrase, std::set<Context>>& entries() const { return entries_; }

    size_t num_substrings() const { return entries_.size(); }
    size_t num_occurrences() const { return num_occurrences_; }

    /**
     * @brief Number of distinct contexts over all entries
     */
    size_t num_distinct_contexts() const;

    bool empty() const { return entries_.empty(); }

    nlohmann::json to_json() const;

private:
    std::map<Phrase, std::set<Context>> entries_;
    std::map<Phrase, std::vector<Occurrence>> occurrences_;
    size_t num_occurrences_ = 0;
};

/**
 * @brief Enumerates every substring of every sentence with its context
 *
 * Context boundaries: with context_width == 0 the left part is every token
 * before the span preceded by BOS_MARKER and the right part every token after
 * it followed by EOS_MARKER. With context_width == k only the k nearest
 * tokens are kept on each side, and a marker is added only on a side whose
 * window reaches the sentence edge.
 */
class ContextExtractor {
public:
    explicit ContextExtractor(const LengthPolicy& policy = LengthPolicy{},
                              int context_width = 0);

    /**
     * @brief Extract the ContextSet of a list of sentences
     */
    ContextSet extract(const std::vector<Sentence>& sentences) const;

    /**
     * @brief Extract the ContextSet of a corpus
     */
    ContextSet extract(const Corpus& corpus) const { return extract(corpus.sentences); }

    /**
     * @brief Context of tokens [start, end) of a sentence
     */
    Context context_at(const Phrase& sentence, size_t start, size_t end) const;

    const LengthPolicy& policy() const { return policy_; }
    int context_width() const { return context_width_; }

private:
    LengthPolicy policy_;
    int context_width_;
};

} // namespace slg
