// include/strata/debug_utils.h
#pragma once

#include <string>
#include <sstream>
#include <iomanip>
#include <cctype> // For std::isprint
#include <iostream>
#include <utility>

// Helper to safely print potentially non-printable key bytes
inline std::string format_key_for_print(const std::string& key) {
    std::ostringstream oss;
    for (unsigned char c : key) {
        if (std::isprint(c)) {
            oss << c;
        } else {
            oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

// --- Logging Macros ---

template<typename... Args>
void print_log_line(std::ostream& os, Args&&... args) {
    // C++17 fold expression: applies operator<< between args
    (os << ... << std::forward<Args>(args));
    os << std::endl;
}

// Define STRATA_DEBUG_LOG to enable TRACE output.
#ifdef STRATA_DEBUG_LOG
    #define LOG_TRACE(...) do { std::cout << "[TRACE] "; print_log_line(std::cout, __VA_ARGS__); } while(0)
#else
    #define LOG_TRACE(...) do {} while(0)
#endif

#define LOG_INFO(...) do { std::cout << "[INFO] "; print_log_line(std::cout, __VA_ARGS__); } while(0)
#define LOG_WARN(...) do { std::cerr << "[WARN] "; print_log_line(std::cerr, __VA_ARGS__); } while(0)
#define LOG_ERROR(...) do { std::cerr << "[ERROR] "; print_log_line(std::cerr, __VA_ARGS__); } while(0)
#define LOG_FATAL(...) do { std::cerr << "[FATAL] "; print_log_line(std::cerr, __VA_ARGS__); } while(0)
