#include "render/graph_renderer.hpp"
#include "common/errors.hpp"
#include <fstream>
#include <sstream>

namespace slg {

namespace {

const char* const CLASS_COLORS[] = {
    "#8dd3c7", "#ffffb3", "#bebada", "#fb8072", "#80b1d3", "#fdb462",
    "#b3de69", "#fccde5", "#d9d9d9", "#bc80bd", "#ccebc5", "#ffed6f"
};
constexpr size_t NUM_CLASS_COLORS = sizeof(CLASS_COLORS) / sizeof(CLASS_COLORS[0]);

std::string class_color(size_t class_id) {
    return CLASS_COLORS[class_id % NUM_CLASS_COLORS];
}

void write_file(const std::string& filename, const std::string& content) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw InputError("Failed to open file for writing: " + filename);
    }
    file << content;
    file.close();
}

std::string escape_html(const std::string& text) {
    std::string escaped;
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

}  // namespace

std::string escape_dot_label(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

// ==========================================
// DotGraphRenderer
// ==========================================

std::string DotGraphRenderer::to_dot(const SubstitutionGraph& graph,
                                     const CongruencePartition& partition) const {
    std::ostringstream out;
    out << "graph SubstitutionGraph {\n";
    out << "  label=\"" << escape_dot_label(title_) << "\";\n";
    out << "  layout=neato;\n";
    out << "  overlap=false;\n";
    out << "  node [shape=ellipse, style=filled, fontname=\"Helvetica\"];\n";
    out << "  edge [fontsize=9, color=gray40];\n\n";

    auto write_node = [&](std::ostringstream& os, size_t index, const std::string& indent) {
        const Phrase& phrase = graph.node(index);
        auto class_id = partition.class_of(phrase);
        os << indent << "n" << index << " [label=\"" << escape_dot_label(label_of(phrase)) << "\"";
        if (class_id) {
            os << ", fillcolor=\"" << class_color(*class_id) << "\"";
        }
        os << "];\n";
    };

    // Multi-member classes as clusters, singletons at top level
    for (const auto& cls : partition.classes()) {
        if (cls.is_singleton()) continue;
        out << "  subgraph cluster_" << cls.nonterminal() << " {\n";
        out << "    label=\"" << cls.nonterminal() << "\";\n";
        for (const auto& member : cls.members) {
            if (auto index = graph.find(member)) {
                write_node(out, *index, "    ");
            }
        }
        out << "  }\n";
    }
    for (const auto& cls : partition.classes()) {
        if (!cls.is_singleton()) continue;
        if (auto index = graph.find(cls.representative)) {
            write_node(out, *index, "  ");
        }
    }

    out << "\n";
    for (const auto& edge : graph.edges()) {
        out << "  n" << edge.first << " -- n" << edge.second
            << " [label=\"" << escape_dot_label(graph.witness(edge).to_string(separator_))
            << "\"];\n";
    }

    out << "}\n";
    return out.str();
}

void DotGraphRenderer::render(const SubstitutionGraph& graph,
                              const CongruencePartition& partition,
                              const std::string& filename) const {
    write_file(filename, to_dot(graph, partition));
}

// ==========================================
// HtmlGraphRenderer
// ==========================================

nlohmann::json HtmlGraphRenderer::to_view_json(const SubstitutionGraph& graph,
                                               const CongruencePartition& partition) const {
    nlohmann::json nodes_json = nlohmann::json::array();
    for (size_t i = 0; i < graph.num_nodes(); ++i) {
        const Phrase& phrase = graph.node(i);
        auto class_id = partition.class_of(phrase);

        nlohmann::json n;
        n["id"] = i;
        n["label"] = label_of(phrase);
        n["degree"] = graph.degree(i);
        n["class"] = class_id ? partition.at(*class_id).nonterminal() : "";
        n["color"] = class_id ? class_color(*class_id) : "#ffffff";
        nodes_json.push_back(n);
    }

    nlohmann::json links_json = nlohmann::json::array();
    for (const auto& edge : graph.edges()) {
        nlohmann::json link;
        link["source"] = edge.first;
        link["target"] = edge.second;
        link["context"] = graph.witness(edge).to_string(separator_);
        links_json.push_back(link);
    }

    nlohmann::json j;
    j["title"] = title_;
    j["nodes"] = nodes_json;
    j["links"] = links_json;
    j["num_classes"] = partition.size();
    return j;
}

void HtmlGraphRenderer::render(const SubstitutionGraph& graph,
                               const CongruencePartition& partition,
                               const std::string& filename) const {
    nlohmann::json data = to_view_json(graph, partition);
    // Keep "</script>" out of the embedded JSON
    std::string payload = data.dump();
    for (size_t pos = payload.find("</"); pos != std::string::npos; pos = payload.find("</", pos + 3)) {
        payload.replace(pos, 2, "<\\/");
    }

    std::ostringstream html;
    html << R"(<!DOCTYPE html>
<html lang="en">
<head>
    <meta charset="UTF-8">
    <meta name="viewport" content="width=device-width, initial-scale=1.0">
    <title>)" << escape_html(title_) << R"(</title>
    <script src="https://d3js.org/d3.v7.min.js"></script>
    <style>
        body { margin: 0; font-family: 'Segoe UI', Tahoma, Geneva, Verdana, sans-serif; background: #fafafa; }
        #header { position: fixed; top: 0; left: 0; right: 0; padding: 10px 20px; background: rgba(255, 255, 255, 0.9); border-bottom: 1px solid #ddd; }
        #header h1 { font-size: 1.2em; margin: 0; font-weight: 500; }
        #stats { font-size: 0.85em; color: #555; }
        #graph { width: 100vw; height: 100vh; }
        .link { stroke: #999; stroke-opacity: 0.6; }
        .node circle { stroke: #333; stroke-width: 1px; }
        .node text { font-size: 11px; pointer-events: none; }
    </style>
</head>
<body>
<div id="header">
    <h1 id="title"></h1>
    <div id="stats"></div>
</div>
<svg id="graph"></svg>
<script>
const data = )" << payload << R"(;
document.getElementById('title').textContent = data.title;
document.getElementById('stats').textContent =
    data.nodes.length + ' substrings, ' + data.links.length + ' edges, ' + data.num_classes + ' classes';

const svg = d3.select('#graph');
const width = window.innerWidth, height = window.innerHeight;
const container = svg.append('g');
svg.call(d3.zoom().on('zoom', (event) => container.attr('transform', event.transform)));

const simulation = d3.forceSimulation(data.nodes)
    .force('link', d3.forceLink(data.links).id(d => d.id).distance(80))
    .force('charge', d3.forceManyBody().strength(-120))
    .force('center', d3.forceCenter(width / 2, height / 2));

const link = container.append('g').selectAll('line')
    .data(data.links).join('line').attr('class', 'link');
link.append('title').text(d => d.context);

const node = container.append('g').selectAll('g')
    .data(data.nodes).join('g').attr('class', 'node')
    .call(d3.drag()
        .on('start', (event, d) => { if (!event.active) simulation.alphaTarget(0.3).restart(); d.fx = d.x; d.fy = d.y; })
        .on('drag', (event, d) => { d.fx = event.x; d.fy = event.y; })
        .on('end', (event, d) => { if (!event.active) simulation.alphaTarget(0); d.fx = null; d.fy = null; }));
node.append('circle').attr('r', d => 6 + Math.sqrt(d.degree)).attr('fill', d => d.color);
node.append('text').attr('dx', 10).attr('dy', 4).text(d => d.label);
node.append('title').text(d => d.class + ': ' + d.label);

simulation.on('tick', () => {
    link.attr('x1', d => d.source.x).attr('y1', d => d.source.y)
        .attr('x2', d => d.target.x).attr('y2', d => d.target.y);
    node.attr('transform', d => 'translate(' + d.x + ',' + d.y + ')');
});
</script>
</body>
</html>
)";

    write_file(filename, html.str());
}

// ==========================================
// Factory
// ==========================================

std::unique_ptr<GraphRenderer> create_graph_renderer(const std::string& format) {
    if (format == "dot") {
        return std::make_unique<DotGraphRenderer>();
    } else if (format == "html") {
        return std::make_unique<HtmlGraphRenderer>();
    }
    throw ConfigurationError("Unknown render format: " + format + " (expected 'dot' or 'html')");
}

} // namespace slg
