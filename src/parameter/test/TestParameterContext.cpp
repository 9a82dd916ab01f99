#include "ParameterContext.hpp"
#include "ScopedEnvVar.hpp"
#include <cassert>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Keeps argv storage alive for the duration of a call
struct Argv {
    explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
        for (auto& arg : storage) {
            pointers.push_back(arg.data());
        }
        pointers.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage.size()); }
    char** argv() { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*> pointers;
};

bool init_throws(std::vector<std::string> args) {
    Argv argv(std::move(args));
    ParameterContext ctx;
    try {
        ctx.init(argv.argc(), argv.argv());
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

}

void test_defaults() {
    ScopedEnvVar home("HOME", std::string("/home/tester"));
    ScopedEnvVar config_env("ARSYNC_CONFIG", std::nullopt);

    Argv argv({"arsync"});
    ParameterContext ctx;
    bool proceed = ctx.init(argv.argc(), argv.argv());
    (void)proceed;
    assert(proceed);

    const RunOptions& options = ctx.get_run_options();
    assert(options.config_path == "/home/tester/.config/arsync.conf");
    assert(options.sync_names.empty());
    assert(options.parallel);
    assert(!options.list);
    assert(!options.dry_run);
    assert(!options.verbose);
    assert(!options.refresh);
    assert(options.log_file.empty());
    std::cout << "test_defaults passed\n";
}

void test_flags_and_names() {
    ScopedEnvVar config_env("ARSYNC_CONFIG", std::nullopt);

    Argv argv({"arsync", "-c", "/tmp/a.conf", "--no-parallel", "-n", "debian", "ubuntu", "-v"});
    ParameterContext ctx;
    assert(ctx.init(argv.argc(), argv.argv()));

    const RunOptions& options = ctx.get_run_options();
    assert(options.config_path == "/tmp/a.conf");
    assert(!options.parallel);
    assert(options.dry_run);
    assert(options.verbose);
    assert((options.sync_names == std::vector<std::string>{"debian", "ubuntu"}));
    std::cout << "test_flags_and_names passed\n";
}

void test_long_option_value_forms() {
    ScopedEnvVar config_env("ARSYNC_CONFIG", std::nullopt);

    Argv with_equals({"arsync", "--config=/etc/arsync.conf", "--list", "--log-file=/tmp/arsync.log"});
    ParameterContext a;
    assert(a.init(with_equals.argc(), with_equals.argv()));

    Argv with_space({"arsync", "--config", "/etc/arsync.conf", "-l", "--log-file", "/tmp/arsync.log"});
    ParameterContext b;
    assert(b.init(with_space.argc(), with_space.argv()));

    assert(a.get_run_options().config_path == b.get_run_options().config_path);
    assert(a.get_run_options().config_path == "/etc/arsync.conf");
    assert(a.get_run_options().list && b.get_run_options().list);
    assert(a.get_run_options().log_file == "/tmp/arsync.log");
    assert(b.get_run_options().log_file == "/tmp/arsync.log");
    std::cout << "test_long_option_value_forms passed\n";
}

void test_environment_config_path() {
    ScopedEnvVar config_env("ARSYNC_CONFIG", std::string("/from/env.conf"));

    Argv plain({"arsync"});
    ParameterContext from_env;
    assert(from_env.init(plain.argc(), plain.argv()));
    assert(from_env.get_run_options().config_path == "/from/env.conf");

    Argv explicit_path({"arsync", "-c", "/from/cli.conf"});
    ParameterContext from_cli;
    assert(from_cli.init(explicit_path.argc(), explicit_path.argv()));
    assert(from_cli.get_run_options().config_path == "/from/cli.conf");
    std::cout << "test_environment_config_path passed\n";
}

void test_refresh() {
    Argv argv({"arsync", "refresh", "ignored"});
    ParameterContext ctx;
    assert(ctx.init(argv.argc(), argv.argv()));
    assert(ctx.get_run_options().refresh);
    assert(ctx.get_run_options().sync_names.empty());

    // Only the first positional is reserved
    Argv later({"arsync", "docs", "refresh"});
    ParameterContext other;
    assert(other.init(later.argc(), later.argv()));
    assert(!other.get_run_options().refresh);
    assert(other.get_run_options().sync_names.size() == 2);
    std::cout << "test_refresh passed\n";
}

void test_double_dash_ends_options() {
    Argv argv({"arsync", "-n", "--", "--weird-name", "-x"});
    ParameterContext ctx;
    assert(ctx.init(argv.argc(), argv.argv()));
    assert(ctx.get_run_options().dry_run);
    assert((ctx.get_run_options().sync_names == std::vector<std::string>{"--weird-name", "-x"}));
    std::cout << "test_double_dash_ends_options passed\n";
}

void test_invalid_command_lines() {
    assert(init_throws({"arsync", "--bogus"}));
    assert(init_throws({"arsync", "-z"}));
    assert(init_throws({"arsync", "-ln"}));
    assert(init_throws({"arsync", "--config"}));
    assert(init_throws({"arsync", "-c"}));
    assert(init_throws({"arsync", "--list=yes"}));
    std::cout << "test_invalid_command_lines passed\n";
}

void test_help_and_version_stop() {
    Argv help({"arsync", "--help"});
    ParameterContext a;
    assert(!a.init(help.argc(), help.argv()));

    Argv version({"arsync", "-V"});
    ParameterContext b;
    assert(!b.init(version.argc(), version.argv()));
    std::cout << "test_help_and_version_stop passed\n";
}

int main() {
    test_defaults();
    test_flags_and_names();
    test_long_option_value_forms();
    test_environment_config_path();
    test_refresh();
    test_double_dash_ends_options();
    test_invalid_command_lines();
    test_help_and_version_stop();

    std::cout << "All ParameterContext tests passed!" << std::endl;
    return 0;
}
