#pragma once

#include <fstream>
#include <string>
#include <iostream>
#include <ctime>
#include <cstdlib>
#include <sstream>

#include <cstdint>
#include <string_view>

#include <fmt/format.h>

constexpr uint32_t fnv1a(std::string_view s) {
    uint32_t h = 2166136261u;
    for (char c : s)
        h = (h ^ uint32_t(c)) * 16777619u;
    return h;
}

// Captures the call-site through default arguments
struct LogSite {
    uint32_t id;

    constexpr LogSite(const char* file = __builtin_FILE(), unsigned line = __builtin_LINE()) : id(fnv1a(file) ^ line) {}
};

// Process-wide log sink. Disabled unless both QEVOLVE_LOG_LEVEL and QEVOLVE_LOG_FILE
// are set, or until configure() is called explicitly.
class Logger {
  public:
    enum Level { INFO, WARNING, ERROR };

    static Logger& get_instance() {
      static Logger instance;
      return instance;
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static void configure(const std::string& level, const std::string& path) {
      Logger& instance = get_instance();
      instance.open(path);
      instance.logging_level = parse_level(level, instance.log_file.is_open());
    }

    static bool enabled() {
      return get_instance().logging_level != logging_disabled;
    }

    static void log_info(const std::string& message, LogSite site={}) {
      if (get_instance().logging_level >= logging_info) {
        log(Level::INFO, site, message);
      }
    }

    static void log_warning(const std::string& message, LogSite site={}) {
      if (get_instance().logging_level >= logging_warnings) {
        log(Level::WARNING, site, message);
      }
    }

    static void log_error(const std::string& message, LogSite site={}) {
      if (get_instance().logging_level >= logging_errors) {
        log(Level::ERROR, site, message);
      }
    }

    static std::string read_log() {
      Logger& instance = get_instance();

      if (!instance.log_file.is_open()) {
        return "";
      }

      instance.log_file.flush();

      std::ifstream in(instance.log_file_path);
      if (!in.is_open()) {
        std::cerr << "Failed to read log file: " << instance.log_file_path << std::endl;
        return "";
      }

      std::ostringstream ss;
      ss << in.rdbuf();
      return ss.str();
    }

  private:
    static constexpr int logging_disabled = 0;
    static constexpr int logging_errors = 1;
    static constexpr int logging_warnings = 2;
    static constexpr int logging_info = 3;

    int logging_level;
    std::string log_file_path;
    std::ofstream log_file;

    Logger() : logging_level(logging_disabled) {
      const char* level = std::getenv("QEVOLVE_LOG_LEVEL");
      const char* filename = std::getenv("QEVOLVE_LOG_FILE");

      if (level != nullptr && filename != nullptr) {
        open(filename);
        logging_level = parse_level(level, log_file.is_open());
      }
    }

    void open(const std::string& path) {
      if (log_file.is_open()) {
        log_file.close();
      }

      log_file_path = path;
      log_file.open(log_file_path, std::ios::app);
      if (!log_file.is_open()) {
        std::cerr << "Failed to open log file: " << log_file_path << std::endl;
      }
    }

    static int parse_level(const std::string& level, bool file_open) {
      if (level == "NONE" || !file_open) {
        return logging_disabled;
      } else if (level == "ERROR" || level == "ERRORS") {
        return logging_errors;
      } else if (level == "WARNING" || level == "WARNINGS") {
        return logging_warnings;
      } else {
        return logging_info;
      }
    }

    static void log(Level level, LogSite site, const std::string& message) {
      Logger& instance = get_instance();

      if (instance.log_file.is_open()) {
        instance.log_file << fmt::format("{} [{}] [{}] {}\n", current_time(), level_to_string(level), site.id, message);
      }
    }

    static std::string level_to_string(Level level) {
      switch (level) {
        case INFO:    return "INFO";
        case WARNING: return "WARNING";
        case ERROR:   return "ERROR";
      }
      return "UNKNOWN";
    }

    static std::string current_time() {
      std::time_t now = std::time(nullptr);
      char buf[100];
      std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", std::localtime(&now));
      return std::string(buf);
    }
};
