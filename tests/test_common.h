#pragma once

#include <cstdlib>
#include <functional>
#include <iostream>
#include <optional>
#include <string>

[[noreturn]] inline void die(const std::string& msg) {
    std::cerr << "TEST FAIL: " << msg << std::endl;
    std::exit(1);
}

inline void expect_true(bool cond, const std::string& msg) {
    if (!cond) die(msg);
}

inline void expect_eq_ll(long long a, long long b, const std::string& msg) {
    if (a != b) {
        die(msg + " (got=" + std::to_string(a) + ", want=" + std::to_string(b) + ")");
    }
}

inline void expect_eq_str(const std::string& a, const std::string& b, const std::string& msg) {
    if (a != b) {
        die(msg + " (got=\"" + a + "\", want=\"" + b + "\")");
    }
}

inline bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

// Runs fn and returns the E it throws; fails the test if it throws nothing
// or something else.
template <typename E>
E expect_throws(const std::function<void()>& fn, const std::string& msg) {
    try {
        fn();
    } catch (const E& e) {
        return e;
    } catch (const std::exception& other) {
        die(msg + " (threw a different exception: " + other.what() + ")");
    }
    die(msg + " (nothing thrown)");
}
