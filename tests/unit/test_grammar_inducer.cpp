#include <gtest/gtest.h>
#include "grammar/grammar_inducer.hpp"
#include "common/errors.hpp"

using namespace slg;

class GrammarInducerTest : public ::testing::Test {
protected:
    Corpus corpus;
    ContextExtractor extractor;
    CongruencePartition partition;

    void SetUp() override {
        corpus = Corpus::from_phrases("SG_2", {
            {"the", "dog", "ran"},
            {"the", "cat", "ran"},
            {"the", "cat", "quickly", "walked"},
            {"the", "cat", "slowly", "walked"}
        });
        SubstitutionGraph graph = SubstitutionGraphBuilder().build(extractor.extract(corpus));
        partition = CongruenceClassResolver().resolve(graph);
    }

    size_t class_of(const Phrase& phrase) const {
        auto id = partition.class_of(phrase);
        EXPECT_TRUE(id.has_value());
        return id.value_or(0);
    }
};

// ==========================================
// Pattern Tests
// ==========================================

TEST_F(GrammarInducerTest, OneNonterminalPerClass) {
    Grammar grammar = GrammarInducer(extractor).induce(corpus, partition);

    EXPECT_EQ(grammar.name, "SG_2");
    EXPECT_EQ(grammar.start_symbol, "S");
    EXPECT_EQ(grammar.nonterminals.size(), partition.size());
    EXPECT_EQ(grammar.fragments.size() + grammar.unproductive.size(), partition.size());
    EXPECT_EQ(grammar.nonterminals.front(), "N0");
}

TEST_F(GrammarInducerTest, NounClassPatterns) {
    Grammar grammar = GrammarInducer(extractor).induce(corpus, partition);
    size_t nouns = class_of({"cat"});

    const GrammarFragment* fragment = grammar.fragment(nouns);
    ASSERT_NE(fragment, nullptr);
    EXPECT_TRUE(fragment->productive);
    EXPECT_EQ(fragment->num_observations(), 3);

    ContextPattern ran{{BOS_MARKER, "the"}, nouns, {"ran", EOS_MARKER}};
    EXPECT_EQ(fragment->patterns.count(ran), 1);
    EXPECT_EQ(ran.to_string(), "<s> the N" + std::to_string(nouns) + " ran </s>");

    // cat x3 + dog x1
    EXPECT_EQ(fragment->occurrences, 4);
}

TEST_F(GrammarInducerTest, ProductiveFlagging) {
    Grammar grammar = GrammarInducer(extractor).induce(corpus, partition);

    // {quickly, slowly} is only ever seen in "the cat _ walked"
    size_t adverbs = class_of({"quickly"});
    EXPECT_FALSE(grammar.is_productive(adverbs));
    ASSERT_EQ(grammar.unproductive.count(adverbs), 1);
    EXPECT_EQ(grammar.unproductive.at(adverbs).num_observations(), 1);
    EXPECT_FALSE(grammar.unproductive.at(adverbs).productive);

    // A singleton class can still be productive
    size_t the = class_of({"the"});
    EXPECT_TRUE(grammar.is_productive(the));
    EXPECT_EQ(grammar.fragments.at(the).num_observations(), 4);

    EXPECT_EQ(grammar.fragments.size(), 5);
    EXPECT_EQ(grammar.unproductive.size(), 4);
}

TEST_F(GrammarInducerTest, ThresholdIsConfigurable) {
    Grammar strict = GrammarInducer(extractor, 4).induce(corpus, partition);
    EXPECT_EQ(strict.fragments.size(), 1);
    EXPECT_TRUE(strict.is_productive(class_of({"the"})));

    Grammar lenient = GrammarInducer(extractor, 1).induce(corpus, partition);
    EXPECT_TRUE(lenient.unproductive.empty());

    EXPECT_THROW(GrammarInducer(extractor, 0), ConfigurationError);
}

// ==========================================
// Rule Tests
// ==========================================

TEST_F(GrammarInducerTest, LexicalRules) {
    Grammar grammar = GrammarInducer(extractor).induce(corpus, partition);

    const GrammarFragment* nouns = grammar.fragment(class_of({"dog"}));
    ASSERT_NE(nouns, nullptr);
    EXPECT_EQ(nouns->lexical_rules, (std::set<std::string>{"cat", "dog"}));

    const GrammarFragment* verbs = grammar.fragment(class_of({"ran"}));
    ASSERT_NE(verbs, nullptr);
    EXPECT_EQ(verbs->lexical_rules, (std::set<std::string>{"ran"}));
}

TEST_F(GrammarInducerTest, DecompositionRules) {
    Grammar grammar = GrammarInducer(extractor).induce(corpus, partition);

    // "cat ran" = cat . ran, "cat quickly walked" also = cat quickly . walked
    const GrammarFragment* predicates = grammar.fragment(class_of({"cat", "ran"}));
    ASSERT_NE(predicates, nullptr);
    EXPECT_TRUE(predicates->lexical_rules.empty());

    std::set<DecompositionRule> expected = {
        DecompositionRule{class_of({"cat"}), class_of({"ran"})},
        DecompositionRule{class_of({"cat", "quickly"}), class_of({"walked"})}
    };
    EXPECT_EQ(predicates->decompositions, expected);

    const GrammarFragment* noun_phrases = grammar.fragment(class_of({"the", "dog"}));
    ASSERT_NE(noun_phrases, nullptr);
    EXPECT_EQ(noun_phrases->decompositions.size(), 1);
    EXPECT_EQ(*noun_phrases->decompositions.begin(),
              (DecompositionRule{class_of({"the"}), class_of({"cat"})}));
}

TEST_F(GrammarInducerTest, AlphabetAndStartStrings) {
    Grammar grammar = GrammarInducer(extractor).induce(corpus, partition);

    EXPECT_EQ(grammar.alphabet,
              (std::set<std::string>{"cat", "dog", "quickly", "ran", "slowly", "the", "walked"}));
    ASSERT_EQ(grammar.start_strings.size(), 4);
    EXPECT_EQ(grammar.start_strings.front(), (Phrase{"the", "dog", "ran"}));
}

TEST_F(GrammarInducerTest, DuplicateSentencesGiveOneStartString) {
    Corpus doubled = corpus;
    doubled.sentences.push_back(corpus.sentences.front());

    Grammar grammar = GrammarInducer(extractor).induce(doubled, partition);
    EXPECT_EQ(grammar.start_strings.size(), 4);
}

TEST_F(GrammarInducerTest, RuleCount) {
    Grammar grammar = GrammarInducer(extractor).induce(corpus, partition);

    size_t total = 0;
    for (const auto& [id, fragment] : grammar.fragments) {
        total += fragment.patterns.size() + fragment.lexical_rules.size() +
                 fragment.decompositions.size();
    }
    EXPECT_EQ(grammar.num_rules(), total);
    EXPECT_GT(total, 0);
}

TEST_F(GrammarInducerTest, ToJson) {
    Grammar grammar = GrammarInducer(extractor).induce(corpus, partition);
    auto j = grammar.to_json();

    EXPECT_EQ(j["start_symbol"], "S");
    EXPECT_EQ(j["fragments"].size(), 5);
    EXPECT_EQ(j["unproductive"].size(), 4);
    EXPECT_EQ(j["alphabet"].size(), 7);
}

// ==========================================
// Degenerate Input
// ==========================================

TEST(GrammarInducerEdgeTest, EmptyPartition) {
    Corpus corpus = Corpus::from_phrases("one", {{"hello"}});
    ContextExtractor extractor;

    Grammar grammar = GrammarInducer(extractor).induce(corpus, CongruencePartition());
    EXPECT_TRUE(grammar.fragments.empty());
    EXPECT_TRUE(grammar.unproductive.empty());
    EXPECT_TRUE(grammar.alphabet.empty());
    EXPECT_EQ(grammar.start_strings.size(), 1);
    EXPECT_EQ(grammar.fragment(0), nullptr);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
