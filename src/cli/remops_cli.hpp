#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Command registration, one function per commands/*.cpp file
void register_shell_commands(BaseCLI& cli);
void register_file_commands(BaseCLI& cli);
void register_scan_commands(BaseCLI& cli);
void register_process_commands(BaseCLI& cli);

class RemopsCLI : public BaseCLI {
public:
    RemopsCLI();

    // Interactive prompt bound to the current target.
    void run_repl();

    // Duplex terminal protocol as newline-delimited JSON on stdin/stdout.
    // The first line is the connect request.
    void run_bridge();

    void run_command(const std::string& command, const std::vector<std::string>& args);

private:
    void register_all_commands();
    bool quit_ = false;
};
