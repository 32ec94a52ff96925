#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <map>
#include <string>
#include <vector>
#include "defpatch/Document.hpp"
#include "defpatch/Engine.hpp"
#include "defpatch/Errors.hpp"
#include "defpatch/Log.hpp"
#include "defpatch/Parse.hpp"
#include "defpatch/PatchLoader.hpp"
#include "defpatch/PathQuery.hpp"
#include "defpatch/Pipeline.hpp"
#include "defpatch/Settings.hpp"

using namespace defpatch;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_HARD_FAILURE = 1;
constexpr int EXIT_OPERATION_FAILED = 2;

std::vector<std::string> list_option(const cxxopts::ParseResult& result, const std::string& name) {
    if (!result.count(name)) return {};
    return result[name].as<std::vector<std::string>>();
}

int cmd_apply(const Settings& settings) {
    Pipeline pipeline(RunOptions::from_settings(settings));
    RunResult run = pipeline.run();

    if (pipeline.options().output_path.empty()) {
        std::cout << run.final_document().to_xml();
    }
    std::cerr << run.report.summary() << "\n";
    return run.report.all_succeeded() ? EXIT_OK : EXIT_OPERATION_FAILED;
}

int cmd_query(const Settings& settings, const std::string& path) {
    RunOptions opts = RunOptions::from_settings(settings);
    Pipeline pipeline(opts);
    Document doc = pipeline.load_base();

    PathExpression expr = PathExpression::parse(path);
    std::vector<Target> targets = select(doc, expr, opts.markers);
    for (const auto& t : targets) {
        switch (t.kind) {
            case TargetKind::Node:
                std::cout << to_xml(*t.node) << "\n";
                break;
            case TargetKind::Text:
                std::cout << t.node->text().value_or("") << "\n";
                break;
            case TargetKind::Attribute:
                std::cout << *t.node->attribute(t.attribute) << "\n";
                break;
        }
    }
    std::cerr << targets.size() << " match(es)\n";
    return targets.empty() ? EXIT_OPERATION_FAILED : EXIT_OK;
}

int cmd_check(const Settings& settings) {
    Pipeline pipeline(RunOptions::from_settings(settings));
    size_t problems = 0;
    for (const auto& unit : pipeline.load_units()) {
        for (const auto& problem : pipeline.engine().validate(unit)) {
            std::cout << problem << "\n";
            ++problems;
        }
    }
    std::cerr << problems << " problem(s)\n";
    return problems == 0 ? EXIT_OK : EXIT_OPERATION_FAILED;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("defpatch", "Apply declarative XML patch documents to a base document");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("c,config", "Path to JSON/TOML settings file", cxxopts::value<std::string>())
            ("set", "Settings override KEY=VALUE (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("log-level", "trace, debug, info, warn, error, critical, off", cxxopts::value<std::string>())
            ("h,help", "Show help");

        // Run inputs; each maps onto a settings key
        options.add_options("Run")
            ("base", "Base document", cxxopts::value<std::string>())
            ("patch", "Patch file, in load order (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("capability", "Capability id present for FindMod (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("out", "Write the final document here instead of stdout", cxxopts::value<std::string>())
            ("report", "Write the JSON execution report here", cxxopts::value<std::string>())
            ("no-inherit", "Skip inheritance resolution");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help({"", "Run"}) << "\n";
            std::cout << "Commands: apply | query PATH | check | config\n";
            return EXIT_OK;
        }

        // Command line beats environment beats file beats defaults
        LoadOptions load;
        load.prefix = ENV_PREFIX;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        for (const auto& assignment : list_option(result, "set")) {
            auto [key, value] = parse_assignment(assignment);
            load.overrides[key] = value;
        }
        if (result.count("base")) load.overrides["base"] = result["base"].as<std::string>();
        if (result.count("patch")) load.overrides["patches"] = list_option(result, "patch");
        if (result.count("capability")) load.overrides["capabilities"] = list_option(result, "capability");
        if (result.count("out")) load.overrides["output"] = result["out"].as<std::string>();
        if (result.count("report")) load.overrides["report"] = result["report"].as<std::string>();
        if (result.count("no-inherit")) load.overrides["inheritance.enabled"] = false;
        if (result.count("log-level")) load.overrides["log.level"] = result["log-level"].as<std::string>();

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        Settings settings = Settings::load(load);
        configure_logging(settings.get<std::string>("log.level", "info"),
                          settings.get<std::string>("log.pattern", ""));

        if (cmd == "apply") {
            return cmd_apply(settings);
        }

        if (cmd == "query") {
            if (cmdv.size() < 2) {
                std::cerr << "Error: query requires a PATH argument\n";
                return EXIT_HARD_FAILURE;
            }
            return cmd_query(settings, cmdv[1]);
        }

        if (cmd == "check") {
            return cmd_check(settings);
        }

        if (cmd == "config") {
            std::cout << settings.to_json_string(2) << "\n";
            return EXIT_OK;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return EXIT_HARD_FAILURE;

    } catch (const MalformedDocumentError& mde) {
        spdlog::error("{}", mde.what());
        return EXIT_HARD_FAILURE;
    } catch (const std::exception& ex) {
        spdlog::error("{}", ex.what());
        return EXIT_HARD_FAILURE;
    }
}
