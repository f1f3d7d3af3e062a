#ifndef SUBSTITUTION_GRAPH_HPP
#define SUBSTITUTION_GRAPH_HPP

#include "grammar/types.hpp"
#include "grammar/context_extractor.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace slg {

/**
 * @brief Statistics about the substitution graph structure
 */
struct GraphStatistics {
    size_t num_nodes = 0;
    size_t num_edges = 0;
    size_t num_isolated_nodes = 0;

    size_t num_contexts = 0;             // Distinct contexts in the inverted index
    size_t num_shared_contexts = 0;      // Contexts exhibited by >= 2 substrings
    size_t max_context_fanout = 0;       // Largest number of substrings sharing one context

    double avg_node_degree = 0.0;
    size_t max_node_degree = 0;
    size_t min_node_degree = 0;

    nlohmann::json to_json() const;
};

/**
 * @brief Undirected graph over distinct substrings
 *
 * SG(S) = (V, E) for a corpus S: V is the set of substrings with at least one
 * context and {u, v} is in E iff u and v occur in a common context. Nodes are
 * indexed in insertion order; the builder inserts them in lexicographic order.
 *
 * Adjacency is binary. Each edge keeps one witness context (the smallest
 * shared context seen) for reports and rendering.
 */
class SubstitutionGraph {
public:
    using Edge = std::pair<size_t, size_t>;   // (smaller index, larger index)

    SubstitutionGraph() = default;

    // ==========================================
    // Node and Edge Management
    // ==========================================

    /**
     * @brief Add a node, or return the index of an existing one
     */
    size_t add_node(const Phrase& phrase);

    /**
     * @brief Connect two substrings through a shared context
     * @return false for self-loops and already-present edges
     *
     * Both endpoints are created if missing.
     */
    bool add_edge(const Phrase& a, const Phrase& b, const Context& shared);

    bool has_node(const Phrase& phrase) const { return index_.count(phrase) > 0; }
    bool has_edge(const Phrase& a, const Phrase& b) const;

    /**
     * @brief Index of a node, if present
     */
    std::optional<size_t> find(const Phrase& phrase) const;

    const Phrase& node(size_t index) const { return nodes_.at(index); }
    const std::vector<Phrase>& nodes() const { return nodes_; }

    /**
     * @brief Neighbour indices of a node
     */
    const std::set<size_t>& neighbors(size_t index) const { return adjacency_.at(index); }

    /**
     * @brief All edges, sorted, each with its smaller index first
     */
    std::vector<Edge> edges() const;

    /**
     * @brief Witness context of an edge, if the edge exists
     */
    std::optional<Context> witness(const Phrase& a, const Phrase& b) const;
    const Context& witness(const Edge& edge) const { return witnesses_.at(edge); }

    size_t degree(size_t index) const { return adjacency_.at(index).size(); }

    size_t num_nodes() const { return nodes_.size(); }
    size_t num_edges() const { return witnesses_.size(); }
    bool empty() const { return nodes_.empty(); }

    /**
     * @brief Context -> node indices exhibiting it (filled by the builder)
     */
    const std::map<Context, std::vector<size_t>>& context_index() const { return context_index_; }

    GraphStatistics compute_statistics() const;

    // ==========================================
    // Export
    // ==========================================

    nlohmann::json to_json() const;

private:
    friend class SubstitutionGraphBuilder;

    std::vector<Phrase> nodes_;                         // index -> phrase
    std::map<Phrase, size_t> index_;                    // phrase -> index
    std::vector<std::set<size_t>> adjacency_;           // index -> neighbour indices
    std::map<Edge, Context> witnesses_;                 // edge -> smallest shared context
    std::map<Context, std::vector<size_t>> context_index_;

    bool connect(size_t ia, size_t ib, const Context& shared);

    static Edge make_edge(size_t a, size_t b) {
        return a < b ? Edge{a, b} : Edge{b, a};
    }
};

/**
 * @brief Builds a SubstitutionGraph from a ContextSet
 *
 * Uses an inverted index Context -> substrings and connects every pair of
 * substrings in each bucket with two or more members. Cost is the sum of k^2
 * over buckets rather than a pairwise intersection of all context sets.
 */
class SubstitutionGraphBuilder {
public:
    SubstitutionGraph build(const ContextSet& contexts) const;
};

} // namespace slg

#endif // SUBSTITUTION_GRAPH_HPP
