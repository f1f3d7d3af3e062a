#pragma once

#include "graph/substitution_graph.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace slg {

/**
 * @brief Disjoint-set forest over node indices
 *
 * Union by size and iterative path compression; no recursion, so large
 * components do not grow the call stack.
 */
class DisjointSet {
public:
    explicit DisjointSet(size_t size);

    size_t find(size_t element);

    /**
     * @brief Merge the sets of a and b
     * @return true if they were in different sets
     */
    bool unite(size_t a, size_t b);

    size_t size() const { return parent_.size(); }
    size_t num_sets() const { return num_sets_; }

private:
    std::vector<size_t> parent_;
    std::vector<size_t> set_size_;
    size_t num_sets_;
};

/**
 * @brief A maximal set of mutually substitutable substrings
 */
struct CongruenceClass {
    size_t id = 0;
    Phrase representative;          // Lexicographically smallest member
    std::vector<Phrase> members;    // Sorted

    size_t size() const { return members.size(); }
    bool is_singleton() const { return members.size() == 1; }

    /**
     * @brief Nonterminal symbol of the class ("N<id>")
     */
    std::string nonterminal() const { return "N" + std::to_string(id); }

    nlohmann::json to_json() const;
};

/**
 * @brief Partition of the substitution graph nodes into congruence classes
 *
 * Class ids follow the order of representatives, so the same graph always
 * yields the same ids.
 */
class CongruencePartition {
public:
    CongruencePartition() = default;
    explicit CongruencePartition(std::vector<CongruenceClass> classes);

    const std::vector<CongruenceClass>& classes() const { return classes_; }
    const CongruenceClass& at(size_t class_id) const { return classes_.at(class_id); }

    /**
     * @brief Class id of a substring, if it is a graph node
     */
    std::optional<size_t> class_of(const Phrase& phrase) const;

    /**
     * @brief Whether two substrings are in the same class
     */
    bool same_class(const Phrase& a, const Phrase& b) const;

    size_t size() const { return classes_.size(); }
    bool empty() const { return classes_.empty(); }

    /**
     * @brief Total number of members over all classes
     */
    size_t num_members() const { return membership_.size(); }

    size_t singleton_count() const;
    size_t largest_class_size() const;

    nlohmann::json to_json() const;

private:
    std::vector<CongruenceClass> classes_;
    std::map<Phrase, size_t> membership_;
};

/**
 * @brief Computes the connected components of a SubstitutionGraph
 */
class CongruenceClassResolver {
public:
    CongruencePartition resolve(const SubstitutionGraph& graph) const;
};

} // namespace slg
