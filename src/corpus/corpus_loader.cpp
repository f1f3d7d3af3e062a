#include "corpus/corpus_loader.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

const char* const REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

// Byte length announced by a UTF-8 lead byte, 0 if it cannot start a sequence
size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

// Overlong forms, surrogates and code points above U+10FFFF are rejected
// through the range allowed for the second byte
bool valid_second_byte(unsigned char lead, unsigned char second) {
    switch (lead) {
        case 0xE0: return second >= 0xA0 && second <= 0xBF;
        case 0xED: return second >= 0x80 && second <= 0x9F;
        case 0xF0: return second >= 0x90 && second <= 0xBF;
        case 0xF4: return second >= 0x80 && second <= 0x8F;
        default: return (second & 0xC0) == 0x80;
    }
}

}  // namespace

namespace slg {

Granularity parse_granularity(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lowered == "word" || lowered == "words") return Granularity::WORD;
    if (lowered == "character" || lowered == "char" || lowered == "chars") {
        return Granularity::CHARACTER;
    }
    throw ConfigurationError("Unknown granularity: " + name +
                             " (expected 'word' or 'character')");
}

std::string to_string(Granularity granularity) {
    return granularity == Granularity::CHARACTER ? "character" : "word";
}

std::vector<std::string> split_utf8_characters(const std::string& text) {
    std::vector<std::string> characters;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t length = utf8_sequence_length(static_cast<unsigned char>(text[pos]));
        bool valid = length > 0 && pos + length <= text.size();
        if (valid && length > 1) {
            valid = valid_second_byte(static_cast<unsigned char>(text[pos]),
                                      static_cast<unsigned char>(text[pos + 1]));
        }
        for (size_t i = 2; valid && i < length; ++i) {
            valid = (static_cast<unsigned char>(text[pos + i]) & 0xC0) == 0x80;
        }

        if (valid) {
            characters.push_back(text.substr(pos, length));
            pos += length;
        } else {
            // Malformed byte: one replacement character, resync on the next byte
            characters.push_back(REPLACEMENT_CHARACTER);
            pos += 1;
        }
    }
    return characters;
}

// ============================================================================
// Segmentation Strategies
// ============================================================================

std::vector<std::string> LineSegmentation::segment(const std::string& text) const {
    std::vector<std::string> segments;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (!line.empty()) {
            segments.push_back(line);
        }
    }
    return segments;
}

std::vector<std::string> PeriodSegmentation::segment(const std::string& text) const {
    // Keep ASCII letters, periods and whitespace only
    std::string cleaned;
    cleaned.reserve(text.size());
    for (unsigned char c : text) {
        if (c < 128 && (std::isalpha(c) || std::isspace(c) || c == '.')) {
            cleaned += static_cast<char>(c);
        }
    }

    std::vector<std::string> segments;
    std::istringstream stream(cleaned);
    std::string piece;
    while (std::getline(stream, piece, '.')) {
        piece = trim(piece);
        if (!piece.empty()) {
            segments.push_back(piece);
        }
    }
    return segments;
}

std::unique_ptr<SegmentationStrategy> create_segmentation(const std::string& name) {
    if (name == "line") {
        return std::make_unique<LineSegmentation>();
    } else if (name == "period") {
        return std::make_unique<PeriodSegmentation>();
    }
    throw ConfigurationError("Unknown segmentation: " + name +
                             " (expected 'period' or 'line')");
}

// ============================================================================
// CorpusLoader
// ============================================================================

CorpusLoader::CorpusLoader(std::unique_ptr<SegmentationStrategy> segmentation,
                           Granularity granularity)
    : segmentation_(std::move(segmentation)), granularity_(granularity) {
    if (!segmentation_) {
        throw ConfigurationError("CorpusLoader requires a segmentation strategy");
    }
}

Corpus CorpusLoader::load(const std::string& path) const {
    std::error_code ec;
    Corpus corpus;
    if (fs::is_directory(path, ec)) {
        corpus = load_directory(path);
    } else if (fs::is_regular_file(path, ec)) {
        corpus = load_file(path);
    } else {
        throw InputError("Input path does not exist or is not readable: " + path);
    }

    if (corpus.empty()) {
        throw InputError("No sentences found in input: " + path);
    }
    return corpus;
}

Corpus CorpusLoader::load_file(const std::string& file_path) const {
    if (verbose_) {
        std::cout << "Loading corpus file: " << file_path << std::endl;
    }

    Corpus corpus;
    corpus.name = fs::path(file_path).filename().string();
    corpus.token_separator = granularity_ == Granularity::CHARACTER ? "" : " ";
    append_text(corpus, read_text_file(file_path), file_path);

    if (verbose_) {
        std::cout << "  Sentences: " << corpus.size() << std::endl;
    }
    return corpus;
}

Corpus CorpusLoader::load_directory(const std::string& directory_path) const {
    std::vector<std::string> files;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(directory_path, ec)) {
        if (entry.is_regular_file()) {
            files.push_back(entry.path().string());
        }
    }
    if (ec) {
        throw InputError("Cannot read directory " + directory_path + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());

    Corpus corpus;
    corpus.name = fs::path(directory_path).filename().string();
    if (corpus.name.empty()) {
        corpus.name = directory_path;
    }
    corpus.token_separator = granularity_ == Granularity::CHARACTER ? "" : " ";

    for (const auto& file : files) {
        if (verbose_) {
            std::cout << "Loading corpus file: " << file << std::endl;
        }
        append_text(corpus, read_text_file(file), file);
    }

    if (verbose_) {
        std::cout << "  Files: " << files.size()
                  << ", sentences: " << corpus.size() << std::endl;
    }
    return corpus;
}

Corpus CorpusLoader::load_text(const std::string& text, const std::string& source_name) const {
    Corpus corpus;
    corpus.name = source_name;
    corpus.token_separator = granularity_ == Granularity::CHARACTER ? "" : " ";
    append_text(corpus, text, source_name);
    return corpus;
}

Phrase CorpusLoader::tokenize(const std::string& segment) const {
    Phrase tokens;
    if (granularity_ == Granularity::CHARACTER) {
        for (auto& character : split_utf8_characters(segment)) {
            if (character.size() == 1 && std::isspace(static_cast<unsigned char>(character[0]))) {
                continue;
            }
            tokens.push_back(std::move(character));
        }
        return tokens;
    }

    std::istringstream stream(segment);
    std::string word;
    while (stream >> word) {
        tokens.push_back(word);
    }
    return tokens;
}

void CorpusLoader::append_text(Corpus& corpus, const std::string& text,
                               const std::string& source_name) const {
    auto segments = segmentation_->segment(text);
    for (size_t i = 0; i < segments.size(); ++i) {
        Phrase tokens = tokenize(segments[i]);
        if (tokens.empty()) continue;

        Sentence sentence;
        sentence.tokens = std::move(tokens);
        sentence.source = source_name;
        sentence.segment_index = i;
        corpus.sentences.push_back(std::move(sentence));
    }
}

std::string read_text_file(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw InputError("Failed to open corpus file: " + file_path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw InputError("Failed to read corpus file: " + file_path);
    }
    return buffer.str();
}

std::vector<Corpus> builtin_corpora() {
    CorpusLoader characters(std::make_unique<LineSegmentation>(), Granularity::CHARACTER);
    Corpus toy = characters.load_text("abbcbba\nabcba\naacaa\naaacaaa\nbbbcbbb\n", "SG_1");

    Corpus words = Corpus::from_phrases("SG_2", {
        {"the", "dog", "ran"},
        {"the", "cat", "ran"},
        {"the", "cat", "quickly", "walked"},
        {"the", "cat", "slowly", "walked"}
    });

    return {toy, words};
}

} // namespace slg
