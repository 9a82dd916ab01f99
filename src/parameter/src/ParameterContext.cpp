#include "ParameterContext.hpp"
#include "ConfigStore.hpp"
#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#ifndef ARSYNC_VERSION
#define ARSYNC_VERSION "unknown"
#endif

#ifndef ARSYNC_BUILD_DATE
#define ARSYNC_BUILD_DATE "unknown"
#endif

ParameterContext::ParameterContext() {}

// Define static member variable
const std::vector<ParameterContext::CommandOption> ParameterContext::valid_options = {
    {"--config", 'c', "Path to configuration file (default: ~/.config/arsync.conf)", true},
    {"--list", 'l', "List available sync operations", false},
    {"--no-parallel", '\0', "Run syncs sequentially instead of in parallel", false},
    {"--dry-run", 'n', "Show what would be done without actually running rsync", false},
    {"--verbose", 'v', "Increase output verbosity", false},
    {"--log-file", '\0', "Also write log messages to this file", true},
    {"--version", 'V', "Output version information", false},
    {"--help", '?', "Display this help message", false}
};

void ParameterContext::show_help() {
    std::cout << "Usage: arsync [OPTIONS]... [SYNC_NAME]...\n\n"
              << "Run the rsync jobs declared in the configuration file. Without\n"
              << "SYNC_NAME every declared sync runs.\n\n"
              << "Options:\n";

    // Calculate the longest option length for alignment
    size_t max_opt_len = 0;
    for (const auto& opt : valid_options) {
        size_t total_len = 4 + opt.long_opt.length(); // 4 = length of "-X, "
        max_opt_len = std::max(max_opt_len, total_len);
    }

    // Reserve fixed space for VALUE
    const size_t value_width = 8;
    const size_t desc_offset = max_opt_len + value_width;

    for (const auto& opt : valid_options) {
        if (opt.short_opt != '\0') {
            std::cout << "  -" << opt.short_opt << ", " << opt.long_opt;
        } else {
            std::cout << "      " << opt.long_opt;
        }

        size_t current_len = 4 + opt.long_opt.length();

        if (opt.requires_value) {
            std::cout << "=VALUE";
            current_len += 6;
        }

        size_t padding = desc_offset > current_len ? desc_offset - current_len : 1;
        std::cout << std::string(padding, ' ');

        std::cout << opt.description << "\n";
    }

    std::cout << "\nExamples:\n"
              << "  arsync                    # Run all syncs\n"
              << "  arsync debian             # Run only 'debian' sync\n"
              << "  arsync debian ubuntu      # Run multiple syncs\n"
              << "  arsync --list             # List available syncs\n"
              << "  arsync --config /path/to/config.conf\n"
              << "  arsync refresh            # Refresh bash completion\n"
              << "\nThe ARSYNC_CONFIG environment variable overrides the default config path.\n\n";
}

void ParameterContext::show_version() {
    std::cout << "arsync version: " << ARSYNC_VERSION << std::endl;
    std::cout << "build: " << ARSYNC_BUILD_DATE << std::endl;
}

void ParameterContext::parse_commandline(int argc, char* argv[]) {
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string key, value;

        if (options_done || arg.empty() || arg[0] != '-' || arg == "-") {
            positional_args.push_back(arg);
            continue;
        }

        if (arg == "--") {
            options_done = true;
            continue;
        }

        // Handle long option format (--key=value)
        if (arg.substr(0, 2) == "--") {
            size_t pos = arg.find('=');
            if (pos != std::string::npos) {
                key = arg.substr(0, pos);
                value = arg.substr(pos + 1);
            } else {
                key = arg;
                value = "";
            }

            // Validate long option
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [&key](const CommandOption& opt) { return opt.long_opt == key; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + key);
            }

            if (it->requires_value) {
                if (pos == std::string::npos) {
                    // Try to get value from next argv
                    if (i + 1 >= argc) {
                        throw std::runtime_error("Option requires a value: " + key);
                    }
                    value = argv[++i];
                }
            } else if (pos != std::string::npos) {
                throw std::runtime_error("Option does not take a value: " + key);
            }

            cli_params[key] = value;
        }
        // Handle short option format (-k value)
        else {
            if (arg.length() != 2) {
                throw std::runtime_error("Invalid short option format '" + arg + "'. Must be single character after '-'");
            }

            char short_opt = arg[1];
            auto it = std::find_if(valid_options.begin(), valid_options.end(),
                [short_opt](const CommandOption& opt) { return opt.short_opt != '\0' && opt.short_opt == short_opt; });

            if (it == valid_options.end()) {
                throw std::runtime_error("Unknown option: " + arg);
            }

            key = it->long_opt;
            if (it->requires_value) {
                if (i + 1 >= argc) {
                    throw std::runtime_error("Option requires a value: " + arg);
                }
                value = argv[++i];
            }

            cli_params[key] = value;
        }
    }
}

void ParameterContext::merge_environment_vars() {
    const char* config_env = std::getenv("ARSYNC_CONFIG");
    if (config_env && config_env[0] != '\0') {
        options_.config_path = config_env;
    }
}

void ParameterContext::merge_commandline() {
    if (cli_params.count("--config")) {
        options_.config_path = cli_params["--config"];
    }
    if (cli_params.count("--log-file")) {
        options_.log_file = cli_params["--log-file"];
    }

    options_.list = cli_params.count("--list") > 0;
    options_.dry_run = cli_params.count("--dry-run") > 0;
    options_.verbose = cli_params.count("--verbose") > 0;
    options_.parallel = cli_params.count("--no-parallel") == 0;

    // "refresh" is reserved for the shell completion wrapper
    if (!positional_args.empty() && positional_args.front() == "refresh") {
        options_.refresh = true;
        options_.sync_names.clear();
    } else {
        options_.sync_names = positional_args;
    }
}

bool ParameterContext::init(int argc, char* argv[]) {
    parse_commandline(argc, argv);

    if (cli_params.count("--help")) {
        show_help();
        return false;
    } else if (cli_params.count("--version")) {
        show_version();
        return false;
    }

    // Merge by priority from low to high
    options_.config_path = ConfigStore::default_path();
    merge_environment_vars();
    merge_commandline();
    return true;
}

const RunOptions& ParameterContext::get_run_options() const {
    return options_;
}
