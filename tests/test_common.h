#pragma once
#include <iostream>
#include <string>
#include <vector>
#include <sstream>
#include <map>
#include <filesystem>
#include <chrono>
#include <random>
#include "lectern/document/text_utils.hpp"

// Prints the failure and bumps the counter; tests return the counter from main().
#define CHECK(cond) do { if (!(cond)) { std::cerr << "[TEST] FAIL " << __FILE__ << ":" << __LINE__ << " " #cond "\n"; ++failures; } } while (0)

#define CHECK_THROWS(expr, Type) do { bool thrown_ = false; try { expr; } catch (const Type &) { thrown_ = true; } \
    if (!thrown_) { std::cerr << "[TEST] FAIL " << __FILE__ << ":" << __LINE__ << " expected " #Type " from " #expr "\n"; ++failures; } } while (0)

inline int report(const char *name, int failures) {
    if (failures == 0) std::cout << "[TEST] OK " << name << "\n";
    else std::cerr << "[TEST] " << name << ": " << failures << " failure(s)\n";
    return failures == 0 ? 0 : 1;
}

// Word multiset of a text, used to check that chunking neither drops nor duplicates words.
inline std::map<std::string, int> word_counts(const std::string &text) {
    std::map<std::string, int> counts;
    for (const auto &w : lectern::document::splitWords(text)) counts[w]++;
    return counts;
}

// Fresh directory under the system temp dir; removed by the caller.
inline std::filesystem::path make_temp_dir(const std::string &prefix) {
    std::mt19937_64 rng(static_cast<unsigned long long>(std::chrono::steady_clock::now().time_since_epoch().count()));
    auto dir = std::filesystem::temp_directory_path() / (prefix + "_" + std::to_string(rng() % 1000000007ULL));
    std::filesystem::create_directories(dir);
    return dir;
}

inline bool files_in_dir_is_empty(const std::filesystem::path &dir) {
    return std::filesystem::directory_iterator(dir) == std::filesystem::directory_iterator();
}
