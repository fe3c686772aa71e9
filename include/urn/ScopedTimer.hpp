#pragma once

#include <chrono>
#include <iostream>
#include <string>
#include <utility>

namespace urn {

//! Measures wall time since construction; prints "label: <t>s" on destruction if labelled.
class ScopedTimer {
public:
    using clock = std::chrono::steady_clock;

    ScopedTimer() : start_(clock::now()) {}

    explicit ScopedTimer(std::string label)
        : label_(std::move(label)), start_(clock::now()) {}

    ScopedTimer(const ScopedTimer &) = delete;
    ScopedTimer &operator=(const ScopedTimer &) = delete;

    ~ScopedTimer() {
        if (!label_.empty())
            std::cout << label_ << ": " << elapsedSeconds() << "s\n";
    }

    [[nodiscard]] double elapsedSeconds() const {
        return std::chrono::duration<double>(clock::now() - start_).count();
    }

private:
    std::string label_;
    clock::time_point start_;
};

}
