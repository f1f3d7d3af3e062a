#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <tuple>
#include <nlohmann/json.hpp>

namespace slg {

// Sentence edge markers. Period segmentation strips '<' and '>', and in
// character mode a marker cannot be a single token.
inline const std::string BOS_MARKER = "<s>";
inline const std::string EOS_MARKER = "</s>";

/**
 * @brief Literal token sequence of a substring (also used for sentences)
 *
 * Phrases compare lexicographically, which gives every map keyed on them a
 * reproducible iteration order.
 */
using Phrase = std::vector<std::string>;

/**
 * @brief Join tokens with a separator ("" for character corpora, " " for words)
 */
std::string join_phrase(const Phrase& phrase, const std::string& separator = " ");

/**
 * @brief The (left, right) tokens surrounding one occurrence of a substring
 */
struct Context {
    Phrase left;    // Begins with BOS_MARKER when it reaches the sentence start
    Phrase right;   // Ends with EOS_MARKER when it reaches the sentence end

    bool operator==(const Context& other) const {
        return left == other.left && right == other.right;
    }
    bool operator!=(const Context& other) const { return !(*this == other); }
    bool operator<(const Context& other) const {
        return std::tie(left, right) < std::tie(other.left, other.right);
    }

    /**
     * @brief Render as "(left _ right)"
     */
    std::string to_string(const std::string& separator = " ") const;

    nlohmann::json to_json() const;
    static Context from_json(const nlohmann::json& j);
};

/**
 * @brief Position of one substring occurrence: tokens [start, end) of a sentence
 */
struct Occurrence {
    size_t sentence_index = 0;
    size_t start = 0;
    size_t end = 0;

    size_t length() const { return end - start; }

    bool operator==(const Occurrence& other) const {
        return sentence_index == other.sentence_index &&
               start == other.start && end == other.end;
    }
};

/**
 * @brief One tokenized sentence of the corpus
 */
struct Sentence {
    Phrase tokens;
    std::string source;         // File (or label) the sentence came from
    size_t segment_index = 0;   // Line or segment number within the source

    size_t size() const { return tokens.size(); }
    bool empty() const { return tokens.empty(); }
};

/**
 * @brief Ordered list of sentences plus the separator used to print them
 */
struct Corpus {
    std::string name;
    std::vector<Sentence> sentences;
    std::string token_separator = " ";

    size_t size() const { return sentences.size(); }
    bool empty() const { return sentences.empty(); }

    /**
     * @brief Total number of tokens over all sentences
     */
    size_t num_tokens() const;

    /**
     * @brief Build a corpus from already-tokenized sentences
     */
    static Corpus from_phrases(const std::string& name,
                               const std::vector<Phrase>& phrases,
                               const std::string& separator = " ");
};

} // namespace slg
