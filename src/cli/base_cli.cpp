#include "base_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>
#include <vector>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        std::cerr << theme::fail(config_result.error);
        std::cerr << theme::step("Using built-in defaults.");
    }
    set_remops_log_path(config.log_path());
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::has_command(const std::string& name) const {
    return commands_.count(name) > 0;
}

// ── Target & connections ────────────────────────────────

bool BaseCLI::set_target(const std::string& host) {
    auto params = make_connect_params(host, options, config);
    if (params.is_err()) {
        report("Bad host", params.error, 2);
        return false;
    }
    disconnect();
    target = params.value;
    return true;
}

bool BaseCLI::require_target() {
    if (!target) {
        report("No host", "give a host, e.g. 'remops exec user@host uptime'", 2);
        return false;
    }
    return true;
}

CommandClient* BaseCLI::commands() {
    if (!require_target()) return nullptr;
    if (client && client->connection().is_open()) return client.get();

    auto r = CommandClient::connect(*target);
    if (r.is_err()) {
        report("Connection failed", r.error);
        return nullptr;
    }
    client = std::move(r.value);
    return client.get();
}

FileTransferClient* BaseCLI::transfers() {
    if (!require_target()) return nullptr;
    if (files && files->connection().is_open()) return files.get();

    auto r = FileTransferClient::connect(*target);
    if (r.is_err()) {
        report("SFTP connection failed", r.error);
        return nullptr;
    }
    files = std::move(r.value);
    return files.get();
}

void BaseCLI::disconnect() {
    files.reset();
    client.reset();
}

void BaseCLI::report(const std::string& what, const std::string& error, int code) {
    std::cerr << theme::fail(error.empty() ? what : what + ": " + error);
    status = code;
}

// ── Dispatch ────────────────────────────────────────────

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    status = 0;
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        report("Unknown command: " + command, "", 2);
        std::cerr << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        report(command, e.what());
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Commands", {"exec", "shell"}},
        {"Files",    {"ls", "stat", "get", "put", "rm", "mv", "mkdir"}},
        {"Network",  {"scan"}},
        {"General",  {"help", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::SAND << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::TEAL
                          << fmt::format("    {:<8}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline needs \001 and \002 around non-printing chars to measure
    // the visible prompt width.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::TEAL) + "remops" + rl_esc(theme::color::RESET);
    if (target) {
        prompt += ":" + rl_esc(theme::color::SAND) + target->username + "@" + target->host_id
                + rl_esc(theme::color::RESET);
    }
    return prompt + "> ";
}
