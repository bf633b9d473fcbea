// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#include <cxxopts.hpp>
#include <fstream>
#include <iostream>

#include "callscope/channel.hpp"
#include "callscope/commands.hpp"
#include "callscope/version.hpp"

using namespace callscope;

void print_banner() {
    std::cout << "callscope - Call Graph Subgraph Extractor v" << VERSION_STRING << "\n"
              << std::endl;
}

static Request build_request(const cxxopts::ParseResult &result) {
    Request request;
    request.roots = split_list(result["function"].as<std::string>());
    request.root_patterns = split_list(result["root-pattern"].as<std::string>());
    request.direction = result.count("reverse") ? Direction::Reverse : Direction::Forward;
    request.max_depth = result["max-depth"].as<int>();
    request.filters.ignore = split_list(result["ignore"].as<std::string>());
    request.filters.ignore_patterns = split_list(result["ignore-pattern"].as<std::string>());
    request.filters.show = split_list(result["show"].as<std::string>());
    request.filters.show_patterns = split_list(result["show-pattern"].as<std::string>());
    request.filters.trim = result.count("trim") > 0;
    request.filters.no_extern = result.count("no-extern") > 0;
    request.end_function = result["end-function"].as<std::string>();
    request.locations = result.count("locations") > 0;
    request.output = result["output"].as<std::string>();
    request.format = result["format"].as<std::string>();
    request.render.font = result["font"].as<std::string>();
    request.render.font_size = result["font-size"].as<int>();
    request.render.rankdir = result["rankdir"].as<std::string>();
    request.keep = result.count("keep") > 0;
    return request;
}

int main(int argc, char *argv[]) {
    cxxopts::Options options(
        "callscope", "Extract small, filtered call graphs rooted at functions of interest");

    auto opts = options.add_options();
    opts("h,help", "Print help");
    opts("v,version", "Print version");
    opts("g,graph", "Graph file produced by the collector",
         cxxopts::value<std::string>()->default_value(GRAPH_FILE));
    opts("f,function", "Root function(s), semicolon-separated",
         cxxopts::value<std::string>()->default_value(""));
    opts("root-pattern", "Regex selecting root functions, semicolon-separated",
         cxxopts::value<std::string>()->default_value(""));
    opts("r,reverse", "Walk callers instead of callees");
    opts("d,max-depth", "Maximum traversal depth (-1 = unlimited)",
         cxxopts::value<int>()->default_value("-1"));
    opts("i,ignore", "Functions to exclude with their subtrees, semicolon-separated",
         cxxopts::value<std::string>()->default_value(""));
    opts("ignore-pattern", "Regexes of functions to exclude, semicolon-separated",
         cxxopts::value<std::string>()->default_value(""));
    opts("s,show", "Functions to show but not expand, semicolon-separated",
         cxxopts::value<std::string>()->default_value(""));
    opts("show-pattern", "Regexes of functions to show but not expand, semicolon-separated",
         cxxopts::value<std::string>()->default_value(""));
    opts("t,trim", "Exclude the built-in list of noise functions (locks, barriers, ...)");
    opts("no-extern", "Exclude functions without a known definition");
    opts("e,end-function", "Keep only paths that reach this function",
         cxxopts::value<std::string>()->default_value(""));
    opts("l,locations", "Label edges with their call-site locations");
    opts("o,output", "Output file ('-' for stdout with plain format)",
         cxxopts::value<std::string>()->default_value("callscope.graph"));
    opts("T,format", "Output format: plain, dot, svg, png, pdf, ps",
         cxxopts::value<std::string>()->default_value("plain"));
    opts("font", "Font name", cxxopts::value<std::string>()->default_value("Helvetica"));
    opts("font-size", "Font size", cxxopts::value<int>()->default_value("10"));
    opts("rankdir", "Layout direction: TB, LR, BT, RL",
         cxxopts::value<std::string>()->default_value("TB"));
    opts("k,keep", "Keep the intermediate graph description (<output>.dot)");
    opts("daemon", "Load the graph once and serve requests from the channel");
    opts("submit", "Send this request to a running daemon");
    opts("channel", "Daemon request channel (FIFO path)",
         cxxopts::value<std::string>()->default_value(DEFAULT_CHANNEL));
    opts("status", "Append diagnostics to this file instead of stderr",
         cxxopts::value<std::string>()->default_value(""));
    opts("list", "List all symbols in the graph");
    opts("search", "Search symbols (comma-separated, no spaces)",
         cxxopts::value<std::vector<std::string>>());

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_banner();
            std::cout << options.help() << std::endl;
            std::cout << "Examples:" << std::endl;
            std::cout << "  callscope -f do_fork                     Callees of do_fork"
                      << std::endl;
            std::cout << "  callscope -f do_fork -d 3 -t             Three levels, noise trimmed"
                      << std::endl;
            std::cout << "  callscope -r -f kfree -d 2               Who calls kfree" << std::endl;
            std::cout << "  callscope -f sys_open -e do_filp_open    Only paths reaching do_filp_open"
                      << std::endl;
            std::cout << "  callscope -f do_fork -T svg -o fork.svg  Render with Graphviz"
                      << std::endl;
            std::cout << "  callscope --daemon                       Serve requests from "
                      << DEFAULT_CHANNEL << std::endl;
            std::cout << "  callscope --submit -f do_fork -T svg -o fork.svg" << std::endl;
            std::cout << "                                           Ask the daemon instead"
                      << std::endl;
            return 0;
        }

        if (result.count("version")) {
            std::cout << "callscope v" << VERSION_STRING << std::endl;
            return 0;
        }

        std::ofstream status_file;
        std::ostream *status = &std::cerr;
        std::string status_path = result["status"].as<std::string>();
        if (!status_path.empty()) {
            status_file.open(status_path, std::ios::app);
            if (!status_file.is_open()) {
                std::cerr << "Error: cannot open status file " << status_path << std::endl;
                return 1;
            }
            status = &status_file;
        }

        std::string graph_path = result["graph"].as<std::string>();
        std::string channel = result["channel"].as<std::string>();

        if (result.count("list")) {
            return cmd_list_symbols(graph_path, *status);
        }

        if (result.count("search")) {
            auto patterns = result["search"].as<std::vector<std::string>>();
            if (!patterns.empty()) {
                return cmd_search(graph_path, patterns, *status);
            }
        }

        if (result.count("daemon")) {
            return cmd_daemon(graph_path, channel, *status);
        }

        Request request = build_request(result);

        if (result.count("submit")) {
            return cmd_submit(channel, request, *status);
        }

        if (argc == 1) {
            print_banner();
            std::cout << options.help() << std::endl;
            return 0;
        }

        return cmd_extract(graph_path, request, *status);

    } catch (const cxxopts::exceptions::exception &e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
