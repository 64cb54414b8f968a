#include <iostream>
#include <string>
#include <vector>
#include <csignal>
#include "commands.hpp"
#include "errors.hpp"
#include "utils.hpp"

static void print_usage() {
    std::cout << "Usage: skillgate [--config PATH] <command> [options]\n\n"
              << "Commands:\n"
              << "  status                      Show current configuration\n"
              << "  skills                      List registered skills\n"
              << "  run <skill> [--params JSON] [--yes]\n"
              << "                              Execute one skill, prompting for approval\n"
              << "  history [--skill ID] [--limit N]\n"
              << "                              Show the audit log\n"
              << "  workflow save|validate|run|list|delete\n"
              << "                              Manage and run skill workflows\n";
}

int main(int argc, char* argv[]) {
#ifndef _WIN32
    // shell hooks write to pipes that may close early
    std::signal(SIGPIPE, SIG_IGN);
#endif

    std::string config_path = skillgate::default_config_path();
    std::vector<std::string> rest;
    for (int i = 1; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            config_path = skillgate::expand_path(argv[++i]);
        } else {
            rest.push_back(a);
        }
    }

    if (rest.empty()) {
        print_usage();
        return 1;
    }

    std::string cmd = rest[0];
    std::vector<std::string> args(rest.begin() + 1, rest.end());

    try {
        if (cmd == "status") {
            return skillgate::cmd_status(config_path);
        }
        else if (cmd == "skills") {
            return skillgate::cmd_skills(config_path);
        }
        else if (cmd == "run") {
            return skillgate::cmd_run(config_path, args);
        }
        else if (cmd == "history") {
            return skillgate::cmd_history(config_path, args);
        }
        else if (cmd == "workflow") {
            return skillgate::cmd_workflow(config_path, args);
        }
        else {
            std::cerr << "Unknown command: " << cmd << "\n";
            print_usage();
            return 1;
        }
    } catch (const skillgate::SkillError& e) {
        std::cerr << "error: " << skillgate::error_kind_name(e.kind()) << ": " << e.what();
        if (!e.ref().empty()) std::cerr << " (" << e.ref() << ")";
        std::cerr << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
