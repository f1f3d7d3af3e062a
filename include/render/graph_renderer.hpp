#pragma once

#include "graph/substitution_graph.hpp"
#include "graph/congruence_classes.hpp"
#include <memory>
#include <string>

namespace slg {

/**
 * @brief Renders a substitution graph and its classes to a file
 *
 * Renderers only consume finished pipeline output; nothing in the core
 * depends on them.
 */
class GraphRenderer {
public:
    virtual ~GraphRenderer() = default;

    /**
     * @brief Write the rendering of graph + partition to filename
     * @throws InputError if the file cannot be written
     */
    virtual void render(const SubstitutionGraph& graph,
                        const CongruencePartition& partition,
                        const std::string& filename) const = 0;

    /**
     * @brief Renderer name ("dot", "html")
     */
    virtual std::string get_name() const = 0;

    /**
     * @brief File extension including the dot
     */
    virtual std::string get_extension() const = 0;

    void set_title(const std::string& title) { title_ = title; }
    void set_token_separator(const std::string& separator) { separator_ = separator; }

protected:
    std::string title_ = "Substitution Graph";
    std::string separator_ = " ";

    std::string label_of(const Phrase& phrase) const { return join_phrase(phrase, separator_); }
};

/**
 * @brief Graphviz DOT output
 *
 * Nodes are coloured by congruence class and classes with more than one
 * member are drawn as clusters. Edge labels show the witness context.
 */
class DotGraphRenderer : public GraphRenderer {
public:
    void render(const SubstitutionGraph& graph,
                const CongruencePartition& partition,
                const std::string& filename) const override;

    std::string get_name() const override { return "dot"; }
    std::string get_extension() const override { return ".dot"; }

    /**
     * @brief Produce the DOT text without writing a file
     */
    std::string to_dot(const SubstitutionGraph& graph,
                       const CongruencePartition& partition) const;
};

/**
 * @brief Self-contained HTML page with a D3.js force layout
 */
class HtmlGraphRenderer : public GraphRenderer {
public:
    void render(const SubstitutionGraph& graph,
                const CongruencePartition& partition,
                const std::string& filename) const override;

    std::string get_name() const override { return "html"; }
    std::string get_extension() const override { return ".html"; }

    /**
     * @brief Node/link data embedded in the page
     */
    nlohmann::json to_view_json(const SubstitutionGraph& graph,
                                const CongruencePartition& partition) const;
};

/**
 * @brief Create a renderer by name ("dot" or "html")
 * @throws ConfigurationError for unknown names
 */
std::unique_ptr<GraphRenderer> create_graph_renderer(const std::string& format);

/**
 * @brief Escape a label for a double-quoted DOT string
 */
std::string escape_dot_label(const std::string& text);

} // namespace slg
