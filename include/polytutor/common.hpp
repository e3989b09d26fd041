#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace polytutor {

using json = nlohmann::json;
namespace fs = std::filesystem;

inline std::string trim(const std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

inline std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

inline bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
  for (const auto& n : needles) {
    if (haystack.find(n) != std::string::npos) {
      return true;
    }
  }
  return false;
}

// Splits on anything that is not alphanumeric. Tokens keep their case.
inline std::vector<std::string> split_words(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (const char c : s) {
    if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
      cur.push_back(c);
    } else if (!cur.empty()) {
      out.push_back(cur);
      cur.clear();
    }
  }
  if (!cur.empty()) {
    out.push_back(cur);
  }
  return out;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
  std::ostringstream out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out << sep;
    }
    out << parts[i];
  }
  return out.str();
}

inline std::string home_dir() {
#ifdef _WIN32
  const char* p = std::getenv("USERPROFILE");
#else
  const char* p = std::getenv("HOME");
#endif
  return p ? std::string(p) : std::string(".");
}

inline fs::path expand_user_path(const std::string& p) {
  if (!p.empty() && p[0] == '~') {
    std::string suffix = p.substr(1);
    while (!suffix.empty() && (suffix.front() == '/' || suffix.front() == '\\')) {
      suffix.erase(suffix.begin());
    }
    return fs::path(home_dir()) / suffix;
  }
  return fs::path(p);
}

inline std::string read_text_file(const fs::path& p) {
  std::ifstream in(p, std::ios::in | std::ios::binary);
  if (!in) {
    return "";
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

inline bool write_text_file(const fs::path& p, const std::string& content) {
  std::error_code ec;
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
  }
  std::ofstream out(p, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }
  out << content;
  return true;
}

inline std::string now_iso8601() {
  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
#ifdef _WIN32
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  return ss.str();
}

inline int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline std::string random_id(std::size_t n = 8) {
  static constexpr char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> d(0, sizeof(alphabet) - 2);

  std::string out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(alphabet[d(rng)]);
  }
  return out;
}

// Process-wide monotonic ids of the form "<prefix>_<ms>_<n>".
inline std::string sequential_id(const std::string& prefix) {
  static std::atomic<uint64_t> counter{0};
  return prefix + "_" + std::to_string(now_ms()) + "_" + std::to_string(++counter);
}

class Logger {
 public:
  enum class Level { kInfo, kWarn, kError, kDebug };

  static void set_json(bool enabled) { json_mode().store(enabled); }
  static void set_min_level(Level level) { min_level().store(level_rank(level)); }

  static Level parse_level(const std::string& name, Level fallback = Level::kInfo) {
    const std::string n = to_lower(trim(name));
    if (n == "debug") {
      return Level::kDebug;
    }
    if (n == "info") {
      return Level::kInfo;
    }
    if (n == "warn" || n == "warning") {
      return Level::kWarn;
    }
    if (n == "error") {
      return Level::kError;
    }
    return fallback;
  }

  static void log(Level level, const std::string& msg) {
    if (level_rank(level) < min_level().load()) {
      return;
    }
    static std::mutex mu;
    std::lock_guard<std::mutex> lock(mu);
    if (json_mode().load()) {
      json j;
      j["time"] = now_iso8601();
      j["level"] = level_name(level);
      j["msg"] = msg;
      std::cerr << j.dump() << "\n";
    } else {
      std::cerr << "[" << level_name(level) << "] " << msg << "\n";
    }
  }

 private:
  static int level_rank(Level level) {
    switch (level) {
      case Level::kDebug:
        return 0;
      case Level::kInfo:
        return 1;
      case Level::kWarn:
        return 2;
      case Level::kError:
      default:
        return 3;
    }
  }

  static std::atomic<bool>& json_mode() {
    static std::atomic<bool> v{false};
    return v;
  }

  static std::atomic<int>& min_level() {
    static std::atomic<int> v{1};
    return v;
  }

  static const char* level_name(Level level) {
    switch (level) {
      case Level::kInfo:
        return "INFO";
      case Level::kWarn:
        return "WARN";
      case Level::kError:
        return "ERROR";
      case Level::kDebug:
      default:
        return "DEBUG";
    }
  }
};

}  // namespace polytutor
