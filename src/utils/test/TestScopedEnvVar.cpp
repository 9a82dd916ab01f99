#include "ScopedEnvVar.hpp"
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

namespace {
std::string unique_env_name(const std::string& base) {
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
    return base + "_" + std::to_string(now) + "_" + std::to_string(tid);
}

bool has_env(const std::string& name) {
    return std::getenv(name.c_str()) != nullptr;
}
}

void test_empty_name_throws() {
    bool threw = false;
    try {
        ScopedEnvVar env("", std::string("value"));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    (void)threw;
    assert(threw);
    std::cout << "test_empty_name_throws passed\n";
}

void test_set_and_restore_new_var() {
    const std::string name = unique_env_name("ARSYNC_TEST_ENV_NEW");
    unsetenv(name.c_str());

    {
        ScopedEnvVar env(name, std::string("new_value"));
        assert(std::string(std::getenv(name.c_str())) == "new_value");
    }

    assert(!has_env(name));
    std::cout << "test_set_and_restore_new_var passed\n";
}

void test_override_and_restore_existing_var() {
    const std::string name = unique_env_name("ARSYNC_TEST_ENV_OLD");
    setenv(name.c_str(), "original", 1);

    {
        ScopedEnvVar env(name, std::string("override"));
        assert(std::string(std::getenv(name.c_str())) == "override");
    }

    assert(std::string(std::getenv(name.c_str())) == "original");
    unsetenv(name.c_str());
    std::cout << "test_override_and_restore_existing_var passed\n";
}

void test_unset_and_restore() {
    const std::string name = unique_env_name("ARSYNC_TEST_ENV_UNSET");
    setenv(name.c_str(), "present", 1);

    {
        ScopedEnvVar env(name, std::nullopt);
        assert(!has_env(name));
    }

    assert(std::string(std::getenv(name.c_str())) == "present");
    unsetenv(name.c_str());
    std::cout << "test_unset_and_restore passed\n";
}

void test_explicit_restore_is_idempotent() {
    const std::string name = unique_env_name("ARSYNC_TEST_ENV_RESTORE");
    unsetenv(name.c_str());

    {
        ScopedEnvVar env(name, std::string("temp"));
        env.restore();
        assert(!has_env(name));

        // The destructor must not undo a later change
        setenv(name.c_str(), "after_restore", 1);
    }

    assert(std::string(std::getenv(name.c_str())) == "after_restore");
    unsetenv(name.c_str());
    std::cout << "test_explicit_restore_is_idempotent passed\n";
}

int main() {
    test_empty_name_throws();
    test_set_and_restore_new_var();
    test_override_and_restore_existing_var();
    test_unset_and_restore();
    test_explicit_restore_is_idempotent();

    std::cout << "All ScopedEnvVar tests passed!" << std::endl;
    return 0;
}
