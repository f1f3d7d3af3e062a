#include "grammar/context_extractor.hpp"
#include "common/errors.hpp"
#include <algorithm>

namespace slg {

// ==========================================
// LengthPolicy
// ==========================================

void LengthPolicy::validate() const {
    if (min_length <= 0) {
        throw ConfigurationError("Minimum substring length must be positive, got " +
                                 std::to_string(min_length));
    }
    if (max_length.has_value()) {
        if (*max_length <= 0) {
            throw ConfigurationError("Maximum substring length must be positive, got " +
                                     std::to_string(*max_length));
        }
        if (min_length > *max_length) {
            throw ConfigurationError("Minimum substring length (" + std::to_string(min_length) +
                                     ") is greater than maximum (" +
                                     std::to_string(*max_length) + ")");
        }
    }
}

bool LengthPolicy::accepts(size_t span_length, size_t sentence_length) const {
    if (span_length == 0 || span_length >= sentence_length) return false;
    if (span_length < static_cast<size_t>(min_length)) return false;
    if (max_length.has_value() && span_length > static_cast<size_t>(*max_length)) return false;
    return true;
}

nlohmann::json LengthPolicy::to_json() const {
    nlohmann::json j;
    j["min_length"] = min_length;
    if (max_length.has_value()) {
        j["max_length"] = *max_length;
    } else {
        j["max_length"] = nullptr;
    }
    return j;
}

// ==========================================
// ContextSet
// ==========================================

ContextSet::ContextSet(std::map<Phrase, std::set<Context>> entries)
    : entries_(std::move(entries)) {}

void ContextSet::add(const Phrase& phrase, const Context& context, const Occurrence& occurrence) {
    entries_[phrase].insert(context);
    occurrences_[phrase].push_back(occurrence);
    num_occurrences_++;
}

const std::set<Context>* ContextSet::contexts_of(const Phrase& phrase) const {
    auto it = entries_.find(phrase);
    if (it == entries_.end()) return nullptr;
    return &it->second;
}

const std::vector<Occurrence>& ContextSet::occurrences_of(const Phrase& phrase) const {
    static const std::vector<Occurrence> none;
    auto it = occurrences_.find(phrase);
    if (it == occurrences_.end()) return none;
    return it->second;
}

size_t ContextSet::num_distinct_contexts() const {
    std::set<Context> all;
    for (const auto& [phrase, contexts] : entries_) {
        all.insert(contexts.begin(), contexts.end());
    }
    return all.size();
}

nlohmann::json ContextSet::to_json() const {
    nlohmann::json entries_json = nlohmann::json::array();
    for (const auto& [phrase, contexts] : entries_) {
        nlohmann::json entry;
        entry["phrase"] = phrase;
        nlohmann::json contexts_json = nlohmann::json::array();
        for (const auto& context : contexts) {
            contexts_json.push_back(context.to_json());
        }
        entry["contexts"] = contexts_json;
        entry["occurrences"] = occurrences_of(phrase).size();
        entries_json.push_back(entry);
    }

    nlohmann::json j;
    j["num_substrings"] = num_substrings();
    j["num_occurrences"] = num_occurrences_;
    j["entries"] = entries_json;
    return j;
}

// ==========================================
// ContextExtractor
// ==========================================

ContextExtractor::ContextExtractor(const LengthPolicy& policy, int context_width)
    : policy_(policy), context_width_(context_width) {
    policy_.validate();
    if (context_width_ < 0) {
        throw ConfigurationError("Context width must not be negative, got " +
                                 std::to_string(context_width_));
    }
}

ContextSet ContextExtractor::extract(const std::vector<Sentence>& sentences) const {
    ContextSet result;

    for (size_t s = 0; s < sentences.size(); ++s) {
        const Phrase& tokens = sentences[s].tokens;
        const size_t n = tokens.size();

        // Quadratic in sentence length: every (start, length) span
        for (size_t length = 1; length < n; ++length) {
            if (!policy_.accepts(length, n)) continue;
            for (size_t start = 0; start + length <= n; ++start) {
                const size_t end = start + length;
                Phrase phrase(tokens.begin() + start, tokens.begin() + end);
                result.add(phrase, context_at(tokens, start, end), Occurrence{s, start, end});
            }
        }
    }

    return result;
}

Context ContextExtractor::context_at(const Phrase& sentence, size_t start, size_t end) const {
    Context context;

    size_t left_begin = 0;
    size_t right_end = sentence.size();
    if (context_width_ > 0) {
        const size_t width = static_cast<size_t>(context_width_);
        left_begin = start > width ? start - width : 0;
        right_end = std::min(sentence.size(), end + width);
    }

    if (left_begin == 0) {
        context.left.push_back(BOS_MARKER);
    }
    context.left.insert(context.left.end(), sentence.begin() + left_begin, sentence.begin() + start);

    context.right.assign(sentence.begin() + end, sentence.begin() + right_end);
    if (right_end == sentence.size()) {
        context.right.push_back(EOS_MARKER);
    }

    return context;
}

} // namespace slg
