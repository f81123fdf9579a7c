// main.cpp
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "agenttrace/core/engine.h"

namespace {

struct CliArgs {
    std::string config_path = agenttrace::kDefaultConfigFile;
    std::string command;
    std::string run_id;
    std::string output;
    std::string format = "json";
    bool analysis = false;
    bool static_view = false;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--config FILE] [command] [run-id] [options]\n"
              << "\n"
              << "Commands:\n"
              << "  (none)              interactive explorer over all runs\n"
              << "  list                list stored runs\n"
              << "  show [run-id]       interactive viewer, following the trace live\n"
              << "  view [run-id]       run summary\n"
              << "  audit [run-id]      reasoning events as JSON (--analysis adds the path)\n"
              << "  mermaid [run-id]    Mermaid flowchart markdown (--output FILE)\n"
              << "  export [run-id]     export for external tools (--format json|jaeger|otel, --output FILE)\n"
              << "\n"
              << "A missing run id selects the latest run.\n";
}

std::string take_value(int& i, int argc, char* argv[]) {
    std::string flag = argv[i];
    if (i + 1 >= argc) throw std::invalid_argument("missing value for " + flag);
    return argv[++i];
}

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            args.config_path = take_value(i, argc, argv);
        } else if (arg == "--output" || arg == "-o") {
            args.output = take_value(i, argc, argv);
        } else if (arg == "--format" || arg == "-f") {
            args.format = take_value(i, argc, argv);
        } else if (arg == "--analysis") {
            args.analysis = true;
        } else if (arg == "--no-follow") {
            args.static_view = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.size() > 2) throw std::invalid_argument("too many arguments");
    if (!positional.empty()) args.command = positional[0];
    if (positional.size() > 1) args.run_id = positional[1];
    return args;
}

void write_output(const std::string& content, const std::string& path, const std::string& what) {
    if (path.empty()) {
        std::cout << content;
        return;
    }
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write file: " + path);
    }
    file << content;
    std::cout << "[✅ SUCCESS] " << what << ": " << path << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    CliArgs args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << "\n\n";
        print_usage(argv[0]);
        return 1;
    }
    if (args.command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    try {
        // 1. 加载配置并创建引擎
        auto engine = agenttrace::TraceEngine::from_config_file(args.config_path);

        if (args.command.empty()) {
            engine->explore();
            return 0;
        }
        if (args.command == "list") {
            std::cout << engine->list_table();
            return 0;
        }

        // 2. 解析运行 ID（缺省为最新一次运行）
        static const std::vector<std::string> kRunCommands = {"show", "view", "audit", "mermaid", "export"};
        bool known = false;
        for (const auto& c : kRunCommands) known = known || c == args.command;
        if (!known) {
            std::cerr << "[ERROR] unknown command: " << args.command << "\n\n";
            print_usage(argv[0]);
            return 1;
        }

        std::optional<std::string> run_id = engine->resolve_run_id(args.run_id);
        if (!run_id) {
            std::cout << "No traces found. Run an instrumented agent to record traces.\n";
            return 0;
        }

        // 3. 执行命令
        if (args.command == "show") {
            engine->show(*run_id, !args.static_view);
        } else if (args.command == "view") {
            std::cout << engine->summary(*run_id);
        } else if (args.command == "audit") {
            write_output(engine->audit(*run_id, args.analysis).dump(2) + "\n", args.output, "Wrote audit");
        } else if (args.command == "mermaid") {
            write_output(engine->mermaid(*run_id), args.output, "Generated Mermaid diagram");
        } else if (args.command == "export") {
            auto format = agenttrace::parse_export_format(args.format);
            write_output(engine->export_run(*run_id, format).dump(2) + "\n", args.output, "Exported trace");
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
