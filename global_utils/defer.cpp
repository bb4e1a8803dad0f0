#pragma once
#include <functional>

// Runs [cleanup] when the enclosing scope is left, including by an exception
struct Defer {
    std::function<void(void)> cleanup;
    Defer(std::function<void()> cleanup)
        : cleanup(std::move(cleanup)) {}
    Defer(const Defer&) = delete;
    Defer& operator=(const Defer&) = delete;
    ~Defer() {
        if (cleanup) cleanup();
    }
};
