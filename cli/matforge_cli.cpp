// FILE: cli/matforge_cli.cpp
#include <getopt.h>

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "engine_config.hpp"
#include "kernel/kernel.hpp"
#include "kernel/services/graph_io_service.hpp"

using namespace mf;

namespace {

void print_cli_help() {
    std::cout
        << "Usage: matforge_cli --graph <file.yaml> [options]\n\n"
        << "Options:\n"
        << "  -c, --config <file>        Engine configuration (default: matforge.yaml)\n"
        << "  -g, --graph <file>         Graph document to load\n"
        << "  -t, --target <name>        Graph or layer stack to run (default: last one in the document)\n"
        << "  -e, --export <node=path>   Export an output node (a channel name for layer stacks)\n"
        << "  -m, --mode <mode>          Linearization mode: topological | full\n"
        << "  -n, --runs <N>             Number of interpretations (default: 1)\n"
        << "  -p, --print                Print the linearized program\n"
        << "  -q, --quiet                Only print errors\n"
        << "  -h, --help                 Show this help\n";
}

void print_error(const Kernel& kernel, const std::string& name, const std::string& action) {
    std::cerr << "Error: " << action;
    if (auto err = kernel.last_error(name)) {
        std::cerr << " [" << graph_errc_name(err->code);
        if (err->interpretation) std::cerr << "/" << interpretation_errc_name(*err->interpretation);
        std::cerr << "]: " << err->message;
    }
    std::cerr << "\n";
}

void print_program(const Program& program) {
    std::size_t index = 0;
    for (const auto& instruction : program.instructions) {
        std::cout << "  " << index++ << ": " << describe(instruction) << "\n";
    }
}

void print_events(const std::vector<ComputeEvent>& events) {
    for (const auto& ev : events) {
        std::cout << "    " << compute_event_name(ev);
        std::visit([](auto&& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, compute_events::OutputReady>) {
                std::cout << " " << e.node << " (" << e.size << "px)";
            } else if constexpr (std::is_same_v<T, compute_events::SocketViewReady> ||
                                 std::is_same_v<T, compute_events::SocketCreated> ||
                                 std::is_same_v<T, compute_events::SocketDestroyed>) {
                std::cout << " " << e.socket;
            } else if constexpr (std::is_same_v<T, compute_events::ImageResourceAdded>) {
                std::cout << " " << e.resource;
            } else if constexpr (std::is_same_v<T, compute_events::VramUsage>) {
                std::cout << " " << (e.bytes_used >> 10) << " / " << (e.bytes_budget >> 10) << " KiB";
            } else {
                std::cout << " " << e.node;
            }
        }, ev);
        std::cout << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_cli_help();
            return 0;
        }
    }

    const char* const short_opts = "hc:g:t:e:m:n:pq";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'},          {"config", required_argument, nullptr, 'c'},
        {"graph", required_argument, nullptr, 'g'},   {"target", required_argument, nullptr, 't'},
        {"export", required_argument, nullptr, 'e'},  {"mode", required_argument, nullptr, 'm'},
        {"runs", required_argument, nullptr, 'n'},    {"print", no_argument, nullptr, 'p'},
        {"quiet", no_argument, nullptr, 'q'},         {nullptr, 0, nullptr, 0}
    };

    std::string config_path = "matforge.yaml";
    std::string graph_path;
    std::string target;
    std::optional<std::string> mode;
    std::vector<std::pair<std::string, std::string>> exports;
    int runs = 1;
    bool print = false;
    bool quiet_flag = false;

    int opt;
    try {
        while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
            switch (opt) {
            case 'c': config_path = optarg; break;
            case 'g': graph_path = optarg; break;
            case 't': target = optarg; break;
            case 'e': {
                std::string spec = optarg;
                auto eq = spec.find('=');
                if (eq == std::string::npos || eq == 0 || eq + 1 == spec.size()) {
                    std::cerr << "Error: --export expects node=path, got '" << spec << "'\n";
                    return 1;
                }
                exports.emplace_back(spec.substr(0, eq), spec.substr(eq + 1));
                break; }
            case 'm': mode = optarg; break;
            case 'n': runs = std::stoi(optarg); break;
            case 'p': print = true; break;
            case 'q': quiet_flag = true; break;
            default: print_cli_help(); return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (graph_path.empty()) {
        std::cerr << "Error: no graph document given; use --graph.\n";
        print_cli_help();
        return 1;
    }

    EngineConfig config;
    load_or_create_config(config_path, config);
    if (quiet_flag) config.quiet = true;

    std::unique_ptr<Kernel> kernel;
    try {
        if (mode) config.linearization_mode = *mode;
        linearization_mode_from_name(config.linearization_mode);
        kernel = std::make_unique<Kernel>(config);
    } catch (const GraphError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    GraphDocument doc;
    try {
        doc = GraphIOService().load(graph_path);
    } catch (const GraphError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
    if (!kernel->apply_document(doc)) {
        print_error(*kernel, "document", "failed to build '" + graph_path + "'");
        return 2;
    }
    if (target.empty()) {
        // 层栈优先，否则取文档中最后一个图
        if (!doc.layer_stacks.empty()) {
            target = doc.layer_stacks.back().name;
        } else if (!doc.graphs.empty()) {
            target = doc.graphs.back().name;
        } else {
            std::cerr << "Error: document '" << graph_path << "' defines no graphs.\n";
            return 2;
        }
    }
    if (!kernel->has_graph(target)) {
        std::cerr << "Error: graph '" << target << "' not found in '" << graph_path << "'.\n";
        return 2;
    }

    int export_bit_depth = config.export_bit_depth;
    ColorSpace export_color_space = ColorSpace::Srgb;
    try {
        export_color_space = color_space_from_name(config.export_color_space);
    } catch (const GraphError& e) {
        std::cerr << "Warning: " << e.what() << ". Using 'srgb'.\n";
    }
    for (const auto& kv : exports) {
        fs::path path = kv.second;
        if (path.is_relative() && !config.export_dir.empty()) {
            fs::create_directories(config.export_dir);
            path = fs::path(config.export_dir) / path;
        }
        if (!kernel->set_export(target, kv.first, ExportSpec{path, export_bit_depth, export_color_space})) {
            print_error(*kernel, target, "cannot export '" + kv.first + "'");
            return 2;
        }
    }

    const Program* program = kernel->program(target);
    if (!program) {
        std::cerr << "Error: graph '" << target << "' has no valid linearization.\n";
        return 3;
    }
    if (print) {
        std::cout << "Program for '" << target << "' (" << program->instructions.size() << " instructions, "
                  << program->execution_steps() << " steps):\n";
        print_program(*program);
    }

    int status = 0;
    for (int run = 0; run < runs; ++run) {
        auto start = std::chrono::steady_clock::now();
        auto report = kernel->compute(target);
        auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
        if (!report) {
            print_error(*kernel, target, "interpretation did not start");
            return 3;
        }
        if (!config.quiet) {
            std::cout << "Run " << run + 1 << " (seq " << report->seq << "): " << report->steps << " steps, "
                      << elapsed.count() << " ms\n";
            print_events(report->events);
        }
        if (!report->ok()) {
            print_error(*kernel, target, "interpretation failed");
            status = 4;
            break;
        }
    }

    if (!exports.empty() && !kernel->wait_for_exports(std::chrono::seconds(30))) {
        std::cerr << "Warning: exports still running after 30 s.\n";
    }
    return status;
}
