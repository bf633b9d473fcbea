#pragma once

#include "callscope/errors.hpp"
#include "callscope/extractor.hpp"
#include "callscope/filter.hpp"
#include "callscope/graph.hpp"
#include "callscope/layout.hpp"
#include "callscope/output.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace callscope::test {

using EdgeList = std::initializer_list<std::pair<const char *, const char *>>;

// Every endpoint is declared and defined in "<name>.c"
inline Graph make_graph(EdgeList edges) {
    Graph graph;
    for (const auto &[caller, callee] : edges) {
        graph.add_node(caller, std::string(caller) + ".c:1", true);
        graph.add_node(callee, std::string(callee) + ".c:1", true);
        graph.add_call(caller, callee);
    }
    return graph;
}

// Same graph with every call reversed
inline Graph make_inverted_graph(EdgeList edges) {
    Graph graph;
    for (const auto &[caller, callee] : edges) {
        graph.add_node(caller, std::string(caller) + ".c:1", true);
        graph.add_node(callee, std::string(callee) + ".c:1", true);
        graph.add_call(callee, caller);
    }
    return graph;
}

inline Graph parse_graph(const std::string &text) {
    std::istringstream in(text);
    return Graph::load(in, "test.json");
}

// A->B->C, the graph most scenarios start from
inline Graph chain_graph() {
    return make_graph({{"A", "B"}, {"B", "C"}});
}

struct Extraction {
    Session session;
    OutputAssembler output;
    size_t retained = 0;

    std::vector<std::string> edges(const Graph &graph) const {
        std::vector<std::string> result;
        for (const auto &record : output.records()) {
            result.push_back(graph.get_symbol(record.from) + "->" + graph.get_symbol(record.to));
        }
        return result;
    }
};

inline void run_extraction(Extraction &run, const Graph &graph, const std::string &root,
                           const FilterConfig &filters = {}, ExtractOptions options = {}) {
    FilterRegistry registry(filters);
    Extractor extractor(graph, registry, options, run.session, run.output);
    run.retained = extractor.extract(graph.resolve(root));
}

inline std::vector<std::string> extract_edges(const Graph &graph, const std::string &root,
                                              const FilterConfig &filters = {},
                                              ExtractOptions options = {}) {
    Extraction run;
    run_extraction(run, graph, root, filters, options);
    return run.edges(graph);
}

inline std::string read_file(const fs::path &path) {
    std::ifstream in(path);
    std::stringstream text;
    text << in.rdbuf();
    return text.str();
}

inline bool contains(const std::vector<std::string> &values, const std::string &value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace callscope::test
