#pragma once

// Test-only environment setter: _putenv("NAME=VALUE") on every platform.
// On non-Windows a local definition in test_env.cpp maps to setenv/unsetenv;
// "NAME=" unsets the variable.

#ifndef _WIN32
extern "C" int _putenv(const char* assignment);
#endif

#include <string>

// Sets an environment variable for the lifetime of a scope, then restores the previous value.
struct scoped_env {
    explicit scoped_env(const char* assignment);
    ~scoped_env();
    scoped_env(const scoped_env&) = delete;
    scoped_env& operator=(const scoped_env&) = delete;
private:
    std::string restore_; // NAME=old, or NAME= when it was unset
};
