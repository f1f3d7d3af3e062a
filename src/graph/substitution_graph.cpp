#include "graph/substitution_graph.hpp"
#include <algorithm>
#include <limits>

namespace slg {

// ==========================================
// GraphStatistics Implementation
// ==========================================

nlohmann::json GraphStatistics::to_json() const {
    nlohmann::json j;
    j["num_nodes"] = num_nodes;
    j["num_edges"] = num_edges;
    j["num_isolated_nodes"] = num_isolated_nodes;
    j["num_contexts"] = num_contexts;
    j["num_shared_contexts"] = num_shared_contexts;
    j["max_context_fanout"] = max_context_fanout;
    j["avg_node_degree"] = avg_node_degree;
    j["max_node_degree"] = max_node_degree;
    j["min_node_degree"] = min_node_degree;
    return j;
}

// ==========================================
// SubstitutionGraph Implementation
// ==========================================

size_t SubstitutionGraph::add_node(const Phrase& phrase) {
    auto it = index_.find(phrase);
    if (it != index_.end()) {
        return it->second;
    }

    size_t index = nodes_.size();
    nodes_.push_back(phrase);
    adjacency_.emplace_back();
    index_.emplace(phrase, index);
    return index;
}

bool SubstitutionGraph::add_edge(const Phrase& a, const Phrase& b, const Context& shared) {
    return connect(add_node(a), add_node(b), shared);
}

bool SubstitutionGraph::connect(size_t ia, size_t ib, const Context& shared) {
    if (ia == ib) {
        return false;
    }

    Edge edge = make_edge(ia, ib);
    auto it = witnesses_.find(edge);
    if (it != witnesses_.end()) {
        if (shared < it->second) {
            it->second = shared;
        }
        return false;
    }

    witnesses_.emplace(edge, shared);
    adjacency_[ia].insert(ib);
    adjacency_[ib].insert(ia);
    return true;
}

bool SubstitutionGraph::has_edge(const Phrase& a, const Phrase& b) const {
    auto ia = find(a);
    auto ib = find(b);
    if (!ia || !ib || *ia == *ib) return false;
    return witnesses_.count(make_edge(*ia, *ib)) > 0;
}

std::optional<size_t> SubstitutionGraph::find(const Phrase& phrase) const {
    auto it = index_.find(phrase);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

std::vector<SubstitutionGraph::Edge> SubstitutionGraph::edges() const {
    std::vector<Edge> result;
    result.reserve(witnesses_.size());
    for (const auto& [edge, context] : witnesses_) {
        result.push_back(edge);
    }
    return result;
}

std::optional<Context> SubstitutionGraph::witness(const Phrase& a, const Phrase& b) const {
    auto ia = find(a);
    auto ib = find(b);
    if (!ia || !ib || *ia == *ib) return std::nullopt;
    auto it = witnesses_.find(make_edge(*ia, *ib));
    if (it == witnesses_.end()) return std::nullopt;
    return it->second;
}

GraphStatistics SubstitutionGraph::compute_statistics() const {
    GraphStatistics stats;
    stats.num_nodes = num_nodes();
    stats.num_edges = num_edges();
    stats.num_contexts = context_index_.size();

    for (const auto& [context, members] : context_index_) {
        if (members.size() > 1) {
            stats.num_shared_contexts++;
        }
        stats.max_context_fanout = std::max(stats.max_context_fanout, members.size());
    }

    if (nodes_.empty()) {
        return stats;
    }

    size_t total_degree = 0;
    stats.min_node_degree = std::numeric_limits<size_t>::max();
    for (const auto& neighbours : adjacency_) {
        size_t d = neighbours.size();
        total_degree += d;
        stats.max_node_degree = std::max(stats.max_node_degree, d);
        stats.min_node_degree = std::min(stats.min_node_degree, d);
        if (d == 0) {
            stats.num_isolated_nodes++;
        }
    }
    stats.avg_node_degree = static_cast<double>(total_degree) / nodes_.size();

    return stats;
}

nlohmann::json SubstitutionGraph::to_json() const {
    nlohmann::json nodes_json = nlohmann::json::array();
    for (size_t i = 0; i < nodes_.size(); ++i) {
        nlohmann::json n;
        n["id"] = i;
        n["phrase"] = nodes_[i];
        n["degree"] = adjacency_[i].size();
        nodes_json.push_back(n);
    }

    nlohmann::json edges_json = nlohmann::json::array();
    for (const auto& [edge, context] : witnesses_) {
        nlohmann::json e;
        e["source"] = edge.first;
        e["target"] = edge.second;
        e["context"] = context.to_json();
        edges_json.push_back(e);
    }

    nlohmann::json j;
    j["nodes"] = nodes_json;
    j["edges"] = edges_json;
    j["statistics"] = compute_statistics().to_json();
    return j;
}

// ==========================================
// SubstitutionGraphBuilder Implementation
// ==========================================

SubstitutionGraph SubstitutionGraphBuilder::build(const ContextSet& contexts) const {
    SubstitutionGraph graph;

    // Nodes first, in phrase order, so indices follow lexicographic order.
    // Phrases with no context are left out of the graph.
    for (const auto& [phrase, phrase_contexts] : contexts.entries()) {
        if (phrase_contexts.empty()) continue;
        size_t index = graph.add_node(phrase);
        for (const auto& context : phrase_contexts) {
            graph.context_index_[context].push_back(index);
        }
    }

    // Every bucket with k >= 2 members contributes its k*(k-1)/2 pairs
    for (const auto& [context, members] : graph.context_index_) {
        if (members.size() < 2) continue;
        for (size_t i = 0; i < members.size(); ++i) {
            for (size_t j = i + 1; j < members.size(); ++j) {
                graph.connect(members[i], members[j], context);
            }
        }
    }

    return graph;
}

} // namespace slg
