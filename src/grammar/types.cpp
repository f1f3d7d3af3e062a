#include "grammar/types.hpp"

namespace slg {

std::string join_phrase(const Phrase& phrase, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < phrase.size(); ++i) {
        if (i > 0) result += separator;
        result += phrase[i];
    }
    return result;
}

// ==========================================
// Context
// ==========================================

std::string Context::to_string(const std::string& separator) const {
    std::string result = "(";
    result += join_phrase(left, separator);
    result += " _ ";
    result += join_phrase(right, separator);
    result += ")";
    return result;
}

nlohmann::json Context::to_json() const {
    nlohmann::json j;
    j["left"] = left;
    j["right"] = right;
    return j;
}

Context Context::from_json(const nlohmann::json& j) {
    Context context;
    context.left = j.at("left").get<Phrase>();
    context.right = j.at("right").get<Phrase>();
    return context;
}

// ==========================================
// Corpus
// ==========================================

size_t Corpus::num_tokens() const {
    size_t total = 0;
    for (const auto& sentence : sentences) {
        total += sentence.size();
    }
    return total;
}

Corpus Corpus::from_phrases(const std::string& name,
                            const std::vector<Phrase>& phrases,
                            const std::string& separator) {
    Corpus corpus;
    corpus.name = name;
    corpus.token_separator = separator;
    for (size_t i = 0; i < phrases.size(); ++i) {
        if (phrases[i].empty()) continue;
        Sentence sentence;
        sentence.tokens = phrases[i];
        sentence.source = name;
        sentence.segment_index = i;
        corpus.sentences.push_back(sentence);
    }
    return corpus;
}

} // namespace slg
