#include "graph/congruence_classes.hpp"
#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace slg {

// ==========================================
// DisjointSet
// ==========================================

DisjointSet::DisjointSet(size_t size)
    : parent_(size), set_size_(size, 1), num_sets_(size) {
    std::iota(parent_.begin(), parent_.end(), 0);
}

size_t DisjointSet::find(size_t element) {
    size_t root = element;
    while (parent_[root] != root) {
        root = parent_[root];
    }
    // Point every node on the path straight at the root
    while (parent_[element] != root) {
        size_t next = parent_[element];
        parent_[element] = root;
        element = next;
    }
    return root;
}

bool DisjointSet::unite(size_t a, size_t b) {
    size_t ra = find(a);
    size_t rb = find(b);
    if (ra == rb) return false;

    if (set_size_[ra] < set_size_[rb]) {
        std::swap(ra, rb);
    }
    parent_[rb] = ra;
    set_size_[ra] += set_size_[rb];
    num_sets_--;
    return true;
}

// ==========================================
// CongruenceClass
// ==========================================

nlohmann::json CongruenceClass::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["nonterminal"] = nonterminal();
    j["representative"] = representative;
    j["members"] = members;
    j["size"] = members.size();
    return j;
}

// ==========================================
// CongruencePartition
// ==========================================

CongruencePartition::CongruencePartition(std::vector<CongruenceClass> classes)
    : classes_(std::move(classes)) {
    for (size_t i = 0; i < classes_.size(); ++i) {
        const CongruenceClass& cls = classes_[i];
        if (cls.id != i) {
            throw std::invalid_argument("Class ids must be consecutive from 0, got " +
                                        std::to_string(cls.id) + " at position " +
                                        std::to_string(i));
        }
        for (const auto& member : cls.members) {
            auto inserted = membership_.emplace(member, cls.id);
            if (!inserted.second) {
                throw std::invalid_argument("Substring \"" + join_phrase(member) +
                                            "\" belongs to more than one class");
            }
        }
    }
}

std::optional<size_t> CongruencePartition::class_of(const Phrase& phrase) const {
    auto it = membership_.find(phrase);
    if (it == membership_.end()) return std::nullopt;
    return it->second;
}

bool CongruencePartition::same_class(const Phrase& a, const Phrase& b) const {
    auto ca = class_of(a);
    auto cb = class_of(b);
    return ca && cb && *ca == *cb;
}

size_t CongruencePartition::singleton_count() const {
    return std::count_if(classes_.begin(), classes_.end(),
                         [](const CongruenceClass& c) { return c.is_singleton(); });
}

size_t CongruencePartition::largest_class_size() const {
    size_t largest = 0;
    for (const auto& cls : classes_) {
        largest = std::max(largest, cls.size());
    }
    return largest;
}

nlohmann::json CongruencePartition::to_json() const {
    nlohmann::json classes_json = nlohmann::json::array();
    for (const auto& cls : classes_) {
        classes_json.push_back(cls.to_json());
    }

    nlohmann::json j;
    j["num_classes"] = classes_.size();
    j["num_singletons"] = singleton_count();
    j["classes"] = classes_json;
    return j;
}

// ==========================================
// CongruenceClassResolver
// ==========================================

CongruencePartition CongruenceClassResolver::resolve(const SubstitutionGraph& graph) const {
    DisjointSet sets(graph.num_nodes());
    for (const auto& [a, b] : graph.edges()) {
        sets.unite(a, b);
    }

    // Group members by root
    std::map<size_t, std::vector<Phrase>> groups;
    for (size_t i = 0; i < graph.num_nodes(); ++i) {
        groups[sets.find(i)].push_back(graph.node(i));
    }

    std::vector<CongruenceClass> classes;
    classes.reserve(groups.size());
    for (auto& [root, members] : groups) {
        std::sort(members.begin(), members.end());
        CongruenceClass cls;
        cls.representative = members.front();
        cls.members = std::move(members);
        classes.push_back(std::move(cls));
    }

    // Root indices depend on union order; representatives do not
    std::sort(classes.begin(), classes.end(),
              [](const CongruenceClass& a, const CongruenceClass& b) {
                  return a.representative < b.representative;
              });
    for (size_t i = 0; i < classes.size(); ++i) {
        classes[i].id = i;
    }

    return CongruencePartition(std::move(classes));
}

} // namespace slg
