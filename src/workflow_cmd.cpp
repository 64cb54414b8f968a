#include "commands.hpp"
#include "engine.hpp"
#include <iostream>

namespace skillgate {

static void print_usage() {
    std::cerr << "Usage: skillgate workflow <command>\n"
              << "  save FILE                     Store a workflow document\n"
              << "  validate FILE|ID              Check structure, skills, cycles and edge types\n"
              << "  run ID [--inputs JSON] [--yes]\n"
              << "  list\n"
              << "  delete ID\n";
}

static Workflow load_workflow_file(const std::string& path) {
    std::string content = read_file(path);
    if (content.empty()) {
        throw SkillError(ErrorKind::path_not_found, "Cannot read workflow file: " + path, path);
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw SkillError(ErrorKind::workflow_invalid, "Invalid JSON in " + path + ": " + e.what(), path);
    }
    return Workflow::from_json(j);
}

int cmd_workflow(const std::string& config_path, const std::vector<std::string>& args) {
    if (args.empty()) {
        print_usage();
        return 1;
    }

    std::string subcmd = args[0];
    Config cfg = Config::load(config_path);
    // only `run` executes skills; the other subcommands never touch the audit DB
    WorkflowStore store(cfg.workflows_dir.empty() ? std::string() : cfg.workflows_path());

    if (subcmd == "save" && args.size() >= 2) {
        Workflow wf = load_workflow_file(args[1]);
        store.save(wf);
        std::cout << "Saved workflow " << wf.id << " (" << wf.nodes.size() << " nodes, "
                  << wf.edges.size() << " edges)\n";
        return 0;
    }
    else if (subcmd == "validate" && args.size() >= 2) {
        Workflow wf = fs::exists(args[1]) ? load_workflow_file(args[1]) : store.get(args[1]);
        Config scratch = cfg;
        scratch.audit_db = ":memory:";
        scratch.hooks.clear();
        SkillEngine engine(scratch);
        engine.validate_workflow(wf);
        std::cout << "Workflow " << wf.id << " is valid\n";
        return 0;
    }
    else if (subcmd == "run" && args.size() >= 2) {
        nlohmann::json inputs = nlohmann::json::object();
        bool yes = false;
        for (size_t i = 2; i < args.size(); i++) {
            if (args[i] == "--inputs" && i + 1 < args.size()) {
                try {
                    inputs = nlohmann::json::parse(args[++i]);
                } catch (const nlohmann::json::parse_error& e) {
                    std::cerr << "Invalid --inputs JSON: " << e.what() << "\n";
                    return 1;
                }
            } else if (args[i] == "--yes" || args[i] == "-y") {
                yes = true;
            }
        }
        SkillEngine engine(cfg);
        install_console_approver(engine, yes);
        WorkflowResult result = engine.execute_workflow(args[1], inputs);
        std::cout << result.to_json().dump(2) << "\n";
        return result.success ? 0 : 1;
    }
    else if (subcmd == "list") {
        auto all = store.list();
        if (all.empty()) {
            std::cout << "No workflows.\n";
            return 0;
        }
        for (auto& wf : all) {
            std::cout << wf.id << " name=\"" << wf.name << "\" nodes=" << wf.nodes.size()
                      << " edges=" << wf.edges.size() << "\n";
        }
        return 0;
    }
    else if (subcmd == "delete" && args.size() >= 2) {
        if (!store.remove(args[1])) {
            std::cerr << "No workflow named " << args[1] << "\n";
            return 1;
        }
        std::cout << "Deleted workflow " << args[1] << "\n";
        return 0;
    }

    print_usage();
    return 1;
}

} // namespace skillgate
