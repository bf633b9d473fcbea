#include "callscope/server.hpp"
#include "utils.hpp"

namespace callscope::test {

// Records what it was asked to render instead of running Graphviz
class FakeEngine : public LayoutEngine {
public:
    std::vector<std::string> formats;
    std::string description;
    bool fail = false;

    void render(const fs::path &description_path, const fs::path &output,
                const std::string &format) override {
        formats.push_back(format);
        description = read_file(description_path);
        if (fail) {
            throw RenderError("dot: syntax error in line 1");
        }
        std::ofstream(output) << "rendered " << format;
    }
};

static Graph kernel_graph() {
    return make_graph({{"sys_read", "vfs_read"},
                       {"sys_write", "vfs_write"},
                       {"vfs_read", "rw_verify_area"},
                       {"vfs_write", "rw_verify_area"},
                       {"unrelated", "helper"}});
}

static Request plain_request(const WorkDir &work, const std::string &root) {
    Request request;
    request.roots = {root};
    request.output = (work.path() / "out.graph").string();
    return request;
}

TEST_CASE("server: plain output is written directly", "[server]") {
    Graph graph = kernel_graph();
    FakeEngine engine;
    std::ostringstream status;
    Server server(graph, engine, status);
    WorkDir work;

    Request request = plain_request(work, "sys_read");
    request.keep = true;
    RequestResult result = server.process(request);

    CHECK(result.edges == 2);
    CHECK(result.nodes == 3);
    CHECK(engine.formats.empty());

    std::string text = read_file(request.output);
    CHECK(text.rfind("digraph callscope {\n", 0) == 0);
    CHECK(text.find("\"sys_read\" -> \"vfs_read\";") != std::string::npos);
    CHECK(text.find("\"vfs_read\" -> \"rw_verify_area\";") != std::string::npos);
    CHECK(read_file(request.output + ".files") == "rw_verify_area.c\nsys_read.c\nvfs_read.c\n");
}

TEST_CASE("server: rendered formats go through the layout engine", "[server]") {
    Graph graph = kernel_graph();
    FakeEngine engine;
    std::ostringstream status;
    Server server(graph, engine, status);
    WorkDir work;

    Request request = plain_request(work, "sys_write");
    request.format = "svg";
    request.output = (work.path() / "out.svg").string();
    server.process(request);

    CHECK(engine.formats == std::vector<std::string>{"svg"});
    CHECK(engine.description.find("\"sys_write\" -> \"vfs_write\";") != std::string::npos);
    CHECK(read_file(request.output) == "rendered svg");
    CHECK_FALSE(fs::exists(request.output + ".dot"));
    CHECK_FALSE(fs::exists(request.output + ".files"));
}

TEST_CASE("server: layout failure keeps the intermediate description", "[server][errors]") {
    Graph graph = kernel_graph();
    FakeEngine engine;
    engine.fail = true;
    std::ostringstream status;
    Server server(graph, engine, status);
    WorkDir work;

    Request request = plain_request(work, "sys_read");
    request.format = "png";
    request.output = (work.path() / "out.png").string();
    request.keep = true;

    CHECK_THROWS_AS(server.process(request), RenderError);
    CHECK(read_file(request.output + ".dot") == engine.description);
    CHECK(fs::exists(request.output + ".files"));
    CHECK(server.run_once(request) == 1);
    CHECK(status.str().find("Error: dot: syntax error") != std::string::npos);
}

TEST_CASE("server: a failed keep does not hide the render failure", "[server][errors]") {
    Graph graph = kernel_graph();
    FakeEngine engine;
    engine.fail = true;
    std::ostringstream status;
    Server server(graph, engine, status);
    WorkDir work;

    // The kept copies would land in a directory that does not exist
    Request request = plain_request(work, "sys_read");
    request.format = "pdf";
    request.output = (work.path() / "missing" / "out.pdf").string();
    request.keep = true;

    CHECK_THROWS_AS(server.process(request), RenderError);
    CHECK(status.str().find("Warning: Failed to keep graph description") != std::string::npos);
    CHECK_FALSE(fs::exists(request.output + ".dot"));

    CHECK(server.run_once(request) == 1);
    CHECK(status.str().find("Error: dot: syntax error") != std::string::npos);
}

TEST_CASE("server: unknown names are not found", "[server][errors]") {
    Graph graph = kernel_graph();
    FakeEngine engine;
    std::ostringstream status;
    Server server(graph, engine, status);
    WorkDir work;

    Request request = plain_request(work, "sys_reed");
    CHECK_THROWS_AS(server.process(request), NotFoundError);

    request = plain_request(work, "sys_read");
    request.end_function = "no_such_function";
    CHECK_THROWS_AS(server.process(request), NotFoundError);

    CHECK(server.run_once(request) == 1);
    CHECK(status.str().find("Error: ") != std::string::npos);
    CHECK_FALSE(fs::exists(request.output));
}

TEST_CASE("server: an empty root does not stop the others", "[server][pruning]") {
    Graph graph = kernel_graph();
    FakeEngine engine;
    std::ostringstream status;
    Server server(graph, engine, status);
    WorkDir work;

    Request request = plain_request(work, "unrelated");
    request.roots.push_back("sys_read");
    request.end_function = "rw_verify_area";
    RequestResult result = server.process(request);

    CHECK(result.roots == 2);
    CHECK(result.empty_roots == 1);
    CHECK(result.edges == 2);
    CHECK(status.str().find("Warning: No path from unrelated") != std::string::npos);

    std::string text = read_file(request.output);
    CHECK(text.find("\"unrelated\"") == std::string::npos);
    CHECK(text.find("\"helper\"") == std::string::npos);
}

TEST_CASE("server: every root empty is an empty result", "[server][pruning]") {
    Graph graph = kernel_graph();
    FakeEngine engine;
    std::ostringstream status;
    Server server(graph, engine, status);
    WorkDir work;

    Request request = plain_request(work, "unrelated");
    request.end_function = "rw_verify_area";
    CHECK_THROWS_AS(server.process(request), EmptyResultError);
    CHECK_FALSE(fs::exists(request.output));

    // Direct mode reports it as a warning, not a failure
    CHECK(server.run_once(request) == 0);
    CHECK(status.str().find("Warning: No graph generated") != std::string::npos);
}

TEST_CASE("server: roots from names and patterns", "[server]") {
    Graph graph = kernel_graph();
    FakeEngine engine;
    std::ostringstream status;
    Server server(graph, engine, status);

    Request request;
    request.roots = {"vfs_read", "vfs_read"};
    request.root_patterns = {"^sys_"};

    std::vector<std::string> names;
    for (NodeId id : server.resolve_roots(request)) {
        names.push_back(graph.get_symbol(id));
    }
    CHECK(names == std::vector<std::string>{"vfs_read", "sys_read", "sys_write"});

    request.roots = {"sys_write"};
    names.clear();
    for (NodeId id : server.resolve_roots(request)) {
        names.push_back(graph.get_symbol(id));
    }
    CHECK(names == std::vector<std::string>{"sys_write", "sys_read"});

    request.root_patterns = {"^compat_"};
    CHECK_THROWS_AS(server.resolve_roots(request), NotFoundError);
}

TEST_CASE("server: daemon records report their outcome", "[server]") {
    Graph graph = kernel_graph();
    FakeEngine engine;
    std::ostringstream status;
    Server server(graph, engine, status);
    WorkDir work;

    CHECK_FALSE(server.handle_record("not a request"));
    CHECK(status.str().find("Error: ") != std::string::npos);

    Request request = plain_request(work, "sys_write");
    CHECK(server.handle_record(request.encode()));
    CHECK(status.str().find("ok " + request.output + " (2 edges, 3 nodes)") !=
          std::string::npos);
    CHECK(fs::exists(request.output));

    CHECK(server.requests_served() == 2);
}

} // namespace callscope::test
