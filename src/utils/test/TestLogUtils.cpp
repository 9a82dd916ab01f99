#include "LogUtils.hpp"
#include <cassert>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <string>

bool log_file_contains(const std::string& log_file, const std::string& keyword) {
    std::ifstream fin(log_file);
    if (!fin.is_open()) return false;
    std::string line;
    while (std::getline(fin, line)) {
        if (line.find(keyword) != std::string::npos) return true;
    }
    return false;
}

void test_init_and_info_log() {
    std::string log_file = "testlog/test_info.log";
    if (std::filesystem::exists(log_file)) std::filesystem::remove(log_file);

    LogUtils::init(LogUtils::Level::Info, log_file, 1024 * 1024, 1);
    LogUtils::info("Hello Info Log");
    LogUtils::shutdown();
    assert(std::filesystem::exists(log_file));
    assert(log_file_contains(log_file, "Hello Info Log"));
    assert(log_file_contains(log_file, "INFO "));
    std::filesystem::remove_all("testlog");
    std::cout << "test_init_and_info_log passed" << std::endl;
}

void test_debug_level_no_output() {
    std::string log_file = "testlog/test_debug.log";
    LogUtils::init(LogUtils::Level::Info, log_file, 1024 * 1024, 1);
    LogUtils::debug("Debug message should not appear");
    LogUtils::info("Info message should appear");
    LogUtils::shutdown();
    assert(!log_file_contains(log_file, "Debug message should not appear"));
    assert(log_file_contains(log_file, "Info message should appear"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_debug_level_no_output passed" << std::endl;
}

void test_warn_error_fatal_log() {
    std::string log_file = "testlog/test_warn_error_fatal.log";
    LogUtils::init(LogUtils::Level::Debug, log_file, 1024 * 1024, 1);
    LogUtils::warn("Warn log");
    LogUtils::error("Error log");
    LogUtils::fatal("Fatal log");
    LogUtils::shutdown();
    assert(log_file_contains(log_file, "Warn log"));
    assert(log_file_contains(log_file, "Error log"));
    assert(log_file_contains(log_file, "FATAL"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_warn_error_fatal_log passed" << std::endl;
}

void test_set_level_runtime() {
    std::string log_file = "testlog/test_set_level.log";
    LogUtils::init(LogUtils::Level::Warn, log_file, 1024 * 1024, 1);
    LogUtils::info("Hidden before set_level");
    LogUtils::set_level(LogUtils::Level::Debug);
    LogUtils::debug("Visible after set_level");
    LogUtils::shutdown();
    assert(!log_file_contains(log_file, "Hidden before set_level"));
    assert(log_file_contains(log_file, "Visible after set_level"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_set_level_runtime passed" << std::endl;
}

void test_format_overloads() {
    std::string log_file = "testlog/test_format.log";
    LogUtils::init(LogUtils::Level::Info, log_file, 1024 * 1024, 1);
    LogUtils::info("Running sync '{}': {}", "docs", "rsync -avPh /a /b");
    LogUtils::warn("Variable ${{{}}} not defined", "BASE");
    LogUtils::shutdown();
    assert(log_file_contains(log_file, "Running sync 'docs': rsync -avPh /a /b"));
    assert(log_file_contains(log_file, "Variable ${BASE} not defined"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_format_overloads passed" << std::endl;
}

void test_reinit_replaces_logger() {
    LogUtils::init(LogUtils::Level::Info);
    assert(LogUtils::logger != nullptr);

    std::string log_file = "testlog/test_reinit.log";
    LogUtils::init(LogUtils::Level::Info, log_file, 1024 * 1024, 1);
    LogUtils::info("After reinit");
    LogUtils::shutdown();
    assert(LogUtils::logger == nullptr);
    assert(log_file_contains(log_file, "After reinit"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_reinit_replaces_logger passed" << std::endl;
}

void test_logging_without_init() {
    // Falls back to plain stream output
    LogUtils::info("Fallback info");
    LogUtils::error("Fallback error {}", 42);
    std::cout << "test_logging_without_init passed" << std::endl;
}

void test_logger_guard() {
    std::string log_file = "testlog/test_guard.log";
    {
        LogUtils::LoggerGuard guard(LogUtils::Level::Info, log_file, 1024 * 1024, 1);
        LogUtils::info("Inside guard");
    }
    assert(LogUtils::logger == nullptr);
    assert(log_file_contains(log_file, "Inside guard"));
    std::filesystem::remove_all("testlog");
    std::cout << "test_logger_guard passed" << std::endl;
}

int main() {
    test_init_and_info_log();
    test_debug_level_no_output();
    test_warn_error_fatal_log();
    test_set_level_runtime();
    test_format_overloads();
    test_reinit_replaces_logger();
    test_logging_without_init();
    test_logger_guard();

    std::cout << "All LogUtils tests passed!" << std::endl;
    return 0;
}
