#include "grammar/grammar_inducer.hpp"
#include "common/errors.hpp"

namespace slg {

// ==========================================
// ContextPattern / GrammarFragment / Grammar
// ==========================================

std::string ContextPattern::to_string(const std::string& separator) const {
    std::string result = join_phrase(left, separator);
    if (!result.empty()) result += " ";
    result += "N" + std::to_string(class_id);
    std::string tail = join_phrase(right, separator);
    if (!tail.empty()) result += " " + tail;
    return result;
}

nlohmann::json ContextPattern::to_json() const {
    nlohmann::json j;
    j["left"] = left;
    j["class_id"] = class_id;
    j["right"] = right;
    return j;
}

nlohmann::json GrammarFragment::to_json() const {
    nlohmann::json j;
    j["class_id"] = class_id;
    j["nonterminal"] = nonterminal;
    j["members"] = members;
    j["occurrences"] = occurrences;
    j["productive"] = productive;

    nlohmann::json patterns_json = nlohmann::json::array();
    for (const auto& pattern : patterns) {
        patterns_json.push_back(pattern.to_json());
    }
    j["patterns"] = patterns_json;
    j["lexical_rules"] = lexical_rules;

    nlohmann::json decompositions_json = nlohmann::json::array();
    for (const auto& rule : decompositions) {
        decompositions_json.push_back(nlohmann::json::array({rule.left_class, rule.right_class}));
    }
    j["decompositions"] = decompositions_json;
    return j;
}

const GrammarFragment* Grammar::fragment(size_t class_id) const {
    auto it = fragments.find(class_id);
    if (it != fragments.end()) return &it->second;
    it = unproductive.find(class_id);
    if (it != unproductive.end()) return &it->second;
    return nullptr;
}

size_t Grammar::num_rules() const {
    size_t total = 0;
    for (const auto& [id, fragment] : fragments) {
        total += fragment.num_rules();
    }
    return total;
}

nlohmann::json Grammar::to_json() const {
    nlohmann::json j;
    j["name"] = name;
    j["start_symbol"] = start_symbol;
    j["alphabet"] = alphabet;
    j["nonterminals"] = nonterminals;
    j["start_strings"] = start_strings;

    nlohmann::json productive_json = nlohmann::json::array();
    for (const auto& [id, fragment] : fragments) {
        productive_json.push_back(fragment.to_json());
    }
    j["fragments"] = productive_json;

    nlohmann::json unproductive_json = nlohmann::json::array();
    for (const auto& [id, fragment] : unproductive) {
        unproductive_json.push_back(fragment.to_json());
    }
    j["unproductive"] = unproductive_json;
    return j;
}

// ==========================================
// GrammarInducer
// ==========================================

GrammarInducer::GrammarInducer(const ContextExtractor& extractor, size_t min_observations)
    : extractor_(extractor), min_observations_(min_observations) {
    if (min_observations_ == 0) {
        throw ConfigurationError("Minimum observations for a productive class must be positive");
    }
}

Grammar GrammarInducer::induce(const Corpus& corpus, const CongruencePartition& partition) const {
    Grammar grammar;
    grammar.name = corpus.name;

    std::vector<GrammarFragment> fragments(partition.size());
    for (const auto& cls : partition.classes()) {
        GrammarFragment& fragment = fragments[cls.id];
        fragment.class_id = cls.id;
        fragment.nonterminal = cls.nonterminal();
        fragment.members = cls.members;
        grammar.nonterminals.push_back(cls.nonterminal());
        for (const auto& member : cls.members) {
            grammar.alphabet.insert(member.begin(), member.end());
        }
    }

    collect_patterns(corpus, partition, fragments);
    collect_member_rules(partition, fragments);

    for (auto& fragment : fragments) {
        fragment.productive = fragment.num_observations() >= min_observations_;
        if (fragment.productive) {
            grammar.fragments.emplace(fragment.class_id, std::move(fragment));
        } else {
            grammar.unproductive.emplace(fragment.class_id, std::move(fragment));
        }
    }

    std::set<Phrase> seen;
    for (const auto& sentence : corpus.sentences) {
        if (seen.insert(sentence.tokens).second) {
            grammar.start_strings.push_back(sentence.tokens);
        }
    }

    return grammar;
}

void GrammarInducer::collect_patterns(const Corpus& corpus,
                                      const CongruencePartition& partition,
                                      std::vector<GrammarFragment>& fragments) const {
    const LengthPolicy& policy = extractor_.policy();

    for (const auto& sentence : corpus.sentences) {
        const Phrase& tokens = sentence.tokens;
        const size_t n = tokens.size();

        for (size_t length = 1; length < n; ++length) {
            if (!policy.accepts(length, n)) continue;
            for (size_t start = 0; start + length <= n; ++start) {
                Phrase span(tokens.begin() + start, tokens.begin() + start + length);
                auto class_id = partition.class_of(span);
                if (!class_id) continue;

                Context context = extractor_.context_at(tokens, start, start + length);
                GrammarFragment& fragment = fragments[*class_id];
                fragment.patterns.insert(ContextPattern{context.left, *class_id, context.right});
                fragment.occurrences++;
            }
        }
    }
}

void GrammarInducer::collect_member_rules(const CongruencePartition& partition,
                                          std::vector<GrammarFragment>& fragments) const {
    for (const auto& cls : partition.classes()) {
        GrammarFragment& fragment = fragments[cls.id];
        for (const auto& member : cls.members) {
            if (member.size() == 1) {
                fragment.lexical_rules.insert(member.front());
                continue;
            }
            for (size_t split = 1; split < member.size(); ++split) {
                Phrase head(member.begin(), member.begin() + split);
                Phrase tail(member.begin() + split, member.end());
                auto head_class = partition.class_of(head);
                auto tail_class = partition.class_of(tail);
                if (head_class && tail_class) {
                    fragment.decompositions.insert(DecompositionRule{*head_class, *tail_class});
                }
            }
        }
    }
}

} // namespace slg
