#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");
int64_t get_env_int(const std::string& name, int64_t default_value);
bool get_env_bool(const std::string& name, bool default_value);

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool contains_ci(const std::string& haystack, const std::string& needle);

// Time utilities
int64_t current_timestamp_ms();
std::string current_iso8601();

// Validation utilities
bool is_valid_evm_address(const std::string& address);
double safe_parse_double(const std::string& str, double default_value = 0.0);
std::optional<int64_t> parse_int(const std::string& str);

// Random utilities
double random_jitter(double base_value, double jitter_factor = 0.1);

} // namespace util
