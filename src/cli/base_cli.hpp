#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <ssh/command_client.hpp>
#include <ssh/file_transfer.hpp>
#include "options.hpp"

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);
    bool has_command(const std::string& name) const;

    // Set the host every remote command talks to.
    bool set_target(const std::string& host);
    bool require_target();

    // Lazily connected clients for the current target. nullptr (after
    // printing why) when the connection cannot be made.
    CommandClient* commands();
    FileTransferClient* transfers();
    void disconnect();

    // Record a failed command: print it and set a nonzero status.
    void report(const std::string& what, const std::string& error, int code = 1);

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;
    std::string get_prompt_string() const;

    Config config;
    CliOptions options;
    std::optional<ConnectParams> target;
    std::unique_ptr<CommandClient> client;
    std::unique_ptr<FileTransferClient> files;
    int status = 0;     // exit status of the last command

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
