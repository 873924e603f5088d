#include "util.hpp"
#include <cstdlib>
#include <stdexcept>
#include <sstream>
#include <algorithm>
#include <random>
#include <iomanip>
#include <cctype>

namespace util {

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

int64_t get_env_int(const std::string& name, int64_t default_value) {
    std::string raw = trim(get_env_var(name));
    if (raw.empty()) {
        return default_value;
    }

    auto parsed = parse_int(raw);
    if (!parsed) {
        throw std::runtime_error("Environment variable " + name + " is not an integer: " + raw);
    }
    return *parsed;
}

bool get_env_bool(const std::string& name, bool default_value) {
    std::string raw = to_lower(trim(get_env_var(name)));
    if (raw.empty()) {
        return default_value;
    }
    if (raw == "1" || raw == "true" || raw == "yes" || raw == "on") {
        return true;
    }
    if (raw == "0" || raw == "false" || raw == "no" || raw == "off") {
        return false;
    }
    throw std::runtime_error("Environment variable " + name + " is not a boolean: " + raw);
}

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter)) {
        token = trim(token);
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string current_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::stringstream ss;
    ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

bool is_valid_evm_address(const std::string& address) {
    if (address.length() != 42) {
        return false;
    }
    if (address[0] != '0' || (address[1] != 'x' && address[1] != 'X')) {
        return false;
    }
    return std::all_of(address.begin() + 2, address.end(),
        [](unsigned char c) { return std::isxdigit(c) != 0; });
}

double safe_parse_double(const std::string& str, double default_value) {
    try {
        return std::stod(str);
    } catch (const std::exception&) {
        return default_value;
    }
}

std::optional<int64_t> parse_int(const std::string& str) {
    try {
        size_t consumed = 0;
        int64_t value = std::stoll(str, &consumed);
        if (consumed != str.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

double random_jitter(double base_value, double jitter_factor) {
    if (jitter_factor <= 0.0) {
        return base_value;
    }

    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_real_distribution<> dis(-jitter_factor, jitter_factor);

    double jitter = dis(gen);
    return base_value * (1.0 + jitter);
}

} // namespace util
