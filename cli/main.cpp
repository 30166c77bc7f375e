// malgraph command line tool.
//
//   malgraph generate <model-file> <langspec.json> [--config <file>] [--output <file>]
//   malgraph inspect <graph-file> [--config <file>] [--model <model-file>]

#include "attackgraph/graph_builder.hpp"
#include "attackgraph/graph_serializer.hpp"
#include "attackgraph/reachability.hpp"
#include "common/config.hpp"
#include "common/document_io.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "language/language_spec.hpp"
#include "model/model.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace malgraph;

namespace {

constexpr int kExitUsage = 2;

struct Arguments {
    std::vector<std::string> positional;
    std::string config_file;
    std::string output_file;
    std::string model_file;
};

void printUsage() {
    std::cerr << "Usage:\n"
              << "  malgraph generate <model-file> <langspec.json> [--config <file>] [--output <file>]\n"
              << "  malgraph inspect <graph-file> [--config <file>] [--model <model-file>]\n";
}

std::optional<Arguments> parseArguments(int argc, char** argv) {
    Arguments args;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };
        if (arg == "--config") {
            if (!value(args.config_file)) return std::nullopt;
        } else if (arg == "--output") {
            if (!value(args.output_file)) return std::nullopt;
        } else if (arg == "--model") {
            if (!value(args.model_file)) return std::nullopt;
        } else if (arg.rfind("--", 0) == 0) {
            return std::nullopt;
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

int generate(const Arguments& args, const ToolboxConfig& config) {
    if (args.positional.size() != 3) {
        printUsage();
        return kExitUsage;
    }
    nlohmann::json language_doc = loadDocument(args.positional[2]);
    if (!config.langspec_file.empty()) {
        saveDocument(config.langspec_file, language_doc);
    }
    LanguageSpec language = LanguageSpec::fromJson(language_doc);

    nlohmann::json model_doc = loadDocument(args.positional[1]);
    if (!config.model_file.empty()) {
        saveDocument(config.model_file, model_doc);
    }
    Model model = Model::fromJson(model_doc);

    GraphBuilder builder(language, model);
    AttackGraph graph;
    try {
        graph = builder.build();
    } catch (const StepExpressionError& e) {
        spdlog::error("Attack graph generation failed when attempting to resolve "
                      "attack step expression: {}", e.what());
        return 1;
    }

    builder.attachAttackers(graph);
    ReachabilityCalculator::calculate(graph);

    std::string output = args.output_file.empty() ? config.attackgraph_file : args.output_file;
    if (!output.empty()) {
        GraphSerializer::saveToFile(graph, output);
    }
    std::cout << "Generated " << graph.nodeCount() << " attack steps, "
              << graph.attackerCount() << " attackers\n";
    return 0;
}

int inspect(const Arguments& args) {
    if (args.positional.size() != 2) {
        printUsage();
        return kExitUsage;
    }
    std::optional<Model> model;
    if (!args.model_file.empty()) {
        model.emplace(Model::loadFromFile(args.model_file));
    }
    AttackGraph graph = GraphSerializer::loadFromFile(args.positional[1], model ? &*model : nullptr);
    ReachabilityCalculator::calculate(graph);

    size_t edges = 0;
    size_t defenses = 0;
    graph.forEachNode([&](const AttackGraphNode& node) {
        edges += node.children.size();
        if (node.type == StepType::Defense) defenses++;
    });
    std::cout << "Attack steps: " << graph.nodeCount() << "\n"
              << "Edges:        " << edges << "\n"
              << "Defenses:     " << defenses << "\n";
    graph.forEachAttacker([](const Attacker& attacker) {
        std::cout << "Attacker " << attacker.name << ": "
                  << attacker.reached_attack_steps.size() << " reached, "
                  << attacker.reachable_attack_steps.size() << " reachable\n";
    });
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    auto args = parseArguments(argc, argv);
    if (!args || args->positional.empty()) {
        printUsage();
        return kExitUsage;
    }

    try {
        ToolboxConfig config;
        if (!args->config_file.empty()) {
            config = ToolboxConfig::loadFromFile(args->config_file);
        }
        config.prepareOutputDir();
        configureLogging(config.logging);

        const std::string& command = args->positional.front();
        if (command == "generate") return generate(*args, config);
        if (command == "inspect") return inspect(*args);
        printUsage();
        return kExitUsage;
    } catch (const MalGraphError& e) {
        spdlog::error("{}", e.what());
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        // Filesystem and YAML emitter failures.
        spdlog::error("Unexpected failure: {}", e.what());
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
