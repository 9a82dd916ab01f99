#pragma once

#include <string>
#include <unordered_map>
#include <vector>


// Everything the command line (and environment) asks arsync to do
struct RunOptions {
    std::string config_path;
    std::vector<std::string> sync_names;  // empty means all
    bool list = false;
    bool parallel = true;
    bool dry_run = false;
    bool verbose = false;
    bool refresh = false;
    std::string log_file;
};

class ParameterContext {
public:
    ParameterContext();

    // Returns false when --help or --version was handled and nothing else should run.
    // Throws std::runtime_error on an invalid command line.
    bool init(int argc, char* argv[]);
    void show_help();
    void show_version();

    // Merge parameter sources
    void parse_commandline(int argc, char* argv[]);
    void merge_environment_vars();
    void merge_commandline();

    const RunOptions& get_run_options() const;

private:
    RunOptions options_;

    // Command line storage
    std::unordered_map<std::string, std::string> cli_params;
    std::vector<std::string> positional_args;

    // Command option structure definition
    struct CommandOption {
        std::string long_opt;    // Long option (e.g. "--config")
        char short_opt;          // Short option (e.g. 'c'), '\0' if none
        std::string description; // Option description
        bool requires_value;     // Whether value is required
    };

    // List of valid command options
    static const std::vector<CommandOption> valid_options;
};
