#pragma once

#include "grammar/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace slg {

// ============================================================================
// Token Granularity
// ============================================================================

enum class Granularity {
    WORD,       ///< Whitespace separated words
    CHARACTER   ///< One token per non-whitespace character (UTF-8 code point)
};

/**
 * @brief Parse "word" / "character" (also "char"); throws ConfigurationError
 */
Granularity parse_granularity(const std::string& name);
std::string to_string(Granularity granularity);

/**
 * @brief Split UTF-8 text into one string per code point
 *
 * Malformed bytes each become U+FFFD, so every returned string is valid UTF-8.
 */
std::vector<std::string> split_utf8_characters(const std::string& text);

// ============================================================================
// Segmentation Strategies
// ============================================================================

/**
 * @brief Abstract base class for splitting raw text into sentence segments
 */
class SegmentationStrategy {
public:
    virtual ~SegmentationStrategy() = default;

    /**
     * @brief Split raw text into untokenized segments
     *
     * @param text Raw file contents
     * @return Non-empty, trimmed segments in input order
     */
    virtual std::vector<std::string> segment(const std::string& text) const = 0;

    /**
     * @brief Get strategy name
     */
    virtual std::string get_name() const = 0;
};

/**
 * @brief One sentence per non-empty line (toy grammars such as "abba")
 */
class LineSegmentation : public SegmentationStrategy {
public:
    std::vector<std::string> segment(const std::string& text) const override;
    std::string get_name() const override { return "line"; }
};

/**
 * @brief Prose: keep letters, periods and whitespace, split on periods
 */
class PeriodSegmentation : public SegmentationStrategy {
public:
    std::vector<std::string> segment(const std::string& text) const override;
    std::string get_name() const override { return "period"; }
};

/**
 * @brief Create a segmentation strategy by name ("line" or "period")
 * @throws ConfigurationError for unknown names
 */
std::unique_ptr<SegmentationStrategy> create_segmentation(const std::string& name);

// ============================================================================
// Corpus Loader
// ============================================================================

/**
 * @brief Reads plain-text files into a tokenized Corpus
 */
class CorpusLoader {
public:
    CorpusLoader(std::unique_ptr<SegmentationStrategy> segmentation,
                 Granularity granularity);

    /**
     * @brief Load a file or every regular file of a directory
     * @throws InputError if the path is missing/unreadable or yields no sentences
     */
    Corpus load(const std::string& path) const;

    /**
     * @brief Load a single file
     * @throws InputError if the file cannot be read
     */
    Corpus load_file(const std::string& file_path) const;

    /**
     * @brief Load all regular files of a directory, sorted by file name
     */
    Corpus load_directory(const std::string& directory_path) const;

    /**
     * @brief Tokenize in-memory text
     */
    Corpus load_text(const std::string& text, const std::string& source_name) const;

    /**
     * @brief Split one segment into tokens according to the granularity
     */
    Phrase tokenize(const std::string& segment) const;

    void set_verbose(bool verbose) { verbose_ = verbose; }

    Granularity granularity() const { return granularity_; }
    const SegmentationStrategy& segmentation() const { return *segmentation_; }

private:
    std::unique_ptr<SegmentationStrategy> segmentation_;
    Granularity granularity_;
    bool verbose_ = false;

    void append_text(Corpus& corpus, const std::string& text,
                     const std::string& source_name) const;
};

/**
 * @brief Read a whole file into memory
 * @throws InputError if the file cannot be opened
 */
std::string read_text_file(const std::string& file_path);

/**
 * @brief The two demonstration corpora: a toy character grammar ("SG_1")
 *        and a small word corpus with substitutable nouns and adverbs ("SG_2")
 */
std::vector<Corpus> builtin_corpora();

} // namespace slg
