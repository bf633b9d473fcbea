#include "utils.hpp"

namespace callscope::test {

static const char *SAMPLE_GRAPH = R"({
  "metadata": {"version": "1.0.0", "num_nodes": 4, "generator": {"name": "collector"}},
  "nodes": [
    {"name": "do_fork", "location": "kernel/fork.c:120",
     "calls": ["copy_process", "wake_up_new_task"],
     "sites": ["copy_process~kernel/fork.c:130", "copy_process~kernel/fork.c:141",
               "trace_fork~kernel/fork.c:150"],
     "attributes": {"stack": 96}, "tags": ["hot", ["nested"]]},
    {"name": "copy_process", "location": "kernel/fork.c:200", "calls": ["do_fork"]},
    {"name": "wake_up_new_task", "defined": false, "calls": []}
  ]
})";

TEST_CASE("graph: loads nodes, edges and call sites", "[graph]") {
    Graph graph = parse_graph(SAMPLE_GRAPH);

    REQUIRE(graph.num_nodes() == 4);
    CHECK(graph.num_edges() == 4);

    NodeId fork = graph.resolve("do_fork");
    const auto &callees = graph.get_callees(fork);
    REQUIRE(callees.size() == 3);
    CHECK(graph.get_symbol(callees[0].target) == "copy_process");
    CHECK(graph.get_symbol(callees[1].target) == "wake_up_new_task");
    CHECK(graph.get_symbol(callees[2].target) == "trace_fork");

    CHECK(callees[0].sites == std::vector<std::string>{"kernel/fork.c:130", "kernel/fork.c:141"});
    CHECK(callees[1].sites.empty());
    CHECK(callees[2].sites == std::vector<std::string>{"kernel/fork.c:150"});

    NodeId copy = graph.resolve("copy_process");
    const auto &callers = graph.get_callers(copy);
    REQUIRE(callers.size() == 1);
    CHECK(callers[0].target == fork);
    CHECK(callers[0].sites.size() == 2);

    // mutual recursion survives the load
    REQUIRE(graph.get_callees(copy).size() == 1);
    CHECK(graph.get_callees(copy)[0].target == fork);
}

TEST_CASE("graph: definition flag and locations", "[graph]") {
    Graph graph = parse_graph(SAMPLE_GRAPH);

    CHECK(graph.is_defined(graph.resolve("do_fork")));
    CHECK_FALSE(graph.is_defined(graph.resolve("wake_up_new_task")));
    // only referenced through a call-site tag
    CHECK_FALSE(graph.is_defined(graph.resolve("trace_fork")));

    CHECK(graph.node(graph.resolve("do_fork")).location == "kernel/fork.c:120");
    CHECK(graph.get_file_path(graph.resolve("do_fork")) == "kernel/fork.c");
    CHECK(graph.get_file_path(graph.resolve("trace_fork")).empty());
}

TEST_CASE("graph: location file extraction", "[graph]") {
    CHECK(location_file("mm/slab.c:42") == "mm/slab.c");
    CHECK(location_file("mm/slab.c") == "mm/slab.c");
    CHECK(location_file("C:/src/a.c:7") == "C:/src/a.c");
    CHECK(location_file("0xffffffff81000000").empty());
    CHECK(location_file("").empty());
}

TEST_CASE("graph: duplicate calls merge into one edge", "[graph]") {
    Graph graph = parse_graph(R"({"metadata": {"version": "1.2.0"},
        "nodes": [{"name": "a", "calls": ["b", "b", "c"]}, {"name": "a", "calls": ["b"]}]})");

    NodeId a = graph.resolve("a");
    CHECK(graph.get_callees(a).size() == 2);
    CHECK(graph.get_callers(graph.resolve("b")).size() == 1);
    CHECK(graph.num_edges() == 2);
}

TEST_CASE("graph: malformed input is an InputError", "[graph][errors]") {
    CHECK_THROWS_AS(parse_graph(R"({"nodes": []})"), InputError);
    CHECK_THROWS_AS(parse_graph(R"({"metadata": {"version": "1.0.0"}})"), InputError);
    CHECK_THROWS_AS(parse_graph(R"({"metadata": {"version": "2.0.0"}, "nodes": []})"),
                    InputError);
    CHECK_THROWS_AS(parse_graph(R"({"metadata": {"version": "one"}, "nodes": []})"),
                    InputError);
    CHECK_THROWS_AS(
        parse_graph(R"({"metadata": {"version": "1.0.0"}, "nodes": [{"location": "a.c:1"}]})"),
        InputError);
    CHECK_THROWS_AS(
        parse_graph(R"({"metadata": {"version": "1.0.0"}, "nodes": [{"name": "a", "sites": ["b"]}]})"),
        InputError);
    CHECK_THROWS_AS(
        parse_graph(R"({"metadata": {"version": "1.0.0"}, "nodes": [{"name": "a", "calls": "b"}]})"),
        InputError);
    CHECK_THROWS_AS(parse_graph(R"({"metadata": {"version": "1.0.0"}, "nodes": ["a"]})"),
                    InputError);
    CHECK_THROWS_AS(parse_graph(R"([1, 2, 3])"), InputError);
    CHECK_THROWS_AS(parse_graph(R"({"metadata": {"version": "1.0.0"}, "nodes": [)"), InputError);
    CHECK_THROWS_AS(Graph::load("/nonexistent/callscope/graph.json"), InputError);
}

TEST_CASE("graph: resolve reports missing roots with suggestions", "[graph][errors]") {
    Graph graph = make_graph({{"sys_open", "do_sys_open"}, {"do_sys_open", "do_filp_open"}});

    CHECK(graph.resolve("sys_open") == graph.get_id("sys_open"));
    CHECK_THROWS_AS(graph.resolve("open"), NotFoundError);

    try {
        graph.resolve("sys_op");
        FAIL("resolve should throw");
    } catch (const NotFoundError &e) {
        std::string message = e.what();
        CHECK(message.find("Symbol not found: sys_op") != std::string::npos);
        CHECK(message.find("sys_open") != std::string::npos);
    }
}

TEST_CASE("graph: symbol search", "[graph]") {
    Graph graph = make_graph({{"sys_open", "do_sys_open"}, {"sys_close", "filp_close"}});

    auto matches = graph.find_symbols(std::vector<std::string>{"sys", "open"});
    std::sort(matches.begin(), matches.end());
    CHECK(matches == std::vector<std::string>{"do_sys_open", "sys_open"});

    auto ids = graph.match_symbols(std::regex("^sys_"));
    REQUIRE(ids.size() == 2);
    CHECK(graph.get_symbol(ids[0]) == "sys_open");
    CHECK(graph.get_symbol(ids[1]) == "sys_close");
}

TEST_CASE("graph: save writes a loadable graph file", "[graph]") {
    Graph original = parse_graph(SAMPLE_GRAPH);

    WorkDir work;
    std::string path = (work.path() / "graph.json").string();
    original.save(path);
    Graph loaded = Graph::load(path);

    CHECK(loaded.num_nodes() == original.num_nodes());
    CHECK(loaded.num_edges() == original.num_edges());
    CHECK(loaded.get_all_symbols() == original.get_all_symbols());
    NodeId fork = loaded.resolve("do_fork");
    CHECK(loaded.get_callees(fork)[0].sites.size() == 2);
    CHECK_FALSE(loaded.is_defined(loaded.resolve("wake_up_new_task")));
}

} // namespace callscope::test
