#pragma once
#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <memory>
#include <mutex>
#include <sstream>
#include <algorithm>
#include <optional>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <climits>

// Usage:
//   auto logger = std::make_shared<Logger>("speaker-link");
//   logger->add_sink(std::make_shared<StdoutSink>());
//   auto dev_log = logger->child("(Kitchen@192.168.1.20)");
//   dev_log->warning("Connection to speaker lost");
// Child loggers share the parent's sinks and prefix every line with their name.

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

inline std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

/// Parse a level name as written in config files ("debug", "INFO", ...).
inline std::optional<LogLevel> log_level_from_string(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(::tolower(c)); });
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warning" || name == "warn") return LogLevel::Warning;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    return std::nullopt;
}

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void log(LogLevel level, const std::string& message) = 0;
    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }

protected:
    LogLevel min_level_ = LogLevel::Info; // Default level set to INFO
};

class StdoutSink : public LogSink {
public:
    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[" << to_string(level) << "] " << message << std::endl;
    }
private:
    std::mutex mutex_;
};

/// Appends timestamped lines to a log file; used when `link.log_file` is configured.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path) : out_(path, std::ios::app) {}

    bool is_open() const { return out_.is_open(); }

    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm_buf{};
        localtime_r(&now, &tm_buf);
        std::lock_guard<std::mutex> lock(mutex_);
        if (!out_) return;
        out_ << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << " [" << to_string(level) << "] " << message << '\n';
        out_.flush();
    }
private:
    std::mutex mutex_;
    std::ofstream out_;
};

class VectorSink : public LogSink {
public:
    void log(LogLevel level, const std::string& message) override {
        if (level < min_level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream oss;
        oss << "[" << to_string(level) << "] " << message;
        lines_.push_back(oss.str());
        levels_.push_back(level);
    }
    std::vector<std::string> get_lines(size_t start = 0, size_t count = SIZE_MAX, LogLevel min_level = LogLevel::Debug) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> filtered;
        for (size_t i = 0; i < lines_.size(); ++i) {
            if (levels_[i] >= min_level) {
                filtered.push_back(lines_[i]);
            }
        }
        if (start >= filtered.size()) return {};
        size_t end = (std::min)(start + count, filtered.size());
        return std::vector<std::string>(filtered.begin() + start, filtered.begin() + end);
    }
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_.size();
    }
private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
    std::vector<LogLevel> levels_;
};

class Logger {
public:
    Logger() : name_("Default"), sinks_(std::make_shared<SinkList>()) {}

    Logger(const std::string& name) : name_(name), sinks_(std::make_shared<SinkList>()) {}

    /**
     * \brief Derive a logger that writes to the same sinks with its own prefix.
     * Sinks added later to either logger are visible to both.
     */
    std::shared_ptr<Logger> child(const std::string& prefix) const {
        auto c = std::make_shared<Logger>(prefix);
        c->sinks_ = sinks_;
        c->prefix_ = prefix;
        return c;
    }

    void add_sink(std::shared_ptr<LogSink> sink) {
        std::lock_guard<std::mutex> lock(sinks_->mutex);
        sinks_->items.push_back(std::move(sink));
    }

    void log(LogLevel level, const std::string& message) {
        const std::string line = prefix_.empty() ? message : prefix_ + " " + message;
        std::vector<std::shared_ptr<LogSink>> targets;
        {
            std::lock_guard<std::mutex> lock(sinks_->mutex);
            targets = sinks_->items;
        }
        for (const auto& sink : targets) {
            sink->log(level, line);
        }
    }

    void debug(const std::string& message)    { log(LogLevel::Debug, message); }
    void info(const std::string& message)     { log(LogLevel::Info, message); }
    void warning(const std::string& message)  { log(LogLevel::Warning, message); }
    void error(const std::string& message)    { log(LogLevel::Error, message); }
    void critical(const std::string& message) { log(LogLevel::Critical, message); }

    const std::string& name() const { return name_; }

    std::vector<std::string> get_lines(int start = 0, int count = INT_MAX, LogLevel min_level = LogLevel::Debug) const {
        if (auto vs = vector_sink()) {
            return vs->get_lines(static_cast<size_t>(start), static_cast<size_t>(count), min_level);
        }
        return {};
    }

    int get_number_of_lines() const {
        if (auto vs = vector_sink()) {
            return static_cast<int>(vs->size());
        }
        return 0;
    }

private:
    struct SinkList {
        std::mutex mutex;
        std::vector<std::shared_ptr<LogSink>> items;
    };

    std::shared_ptr<VectorSink> vector_sink() const {
        std::lock_guard<std::mutex> lock(sinks_->mutex);
        for (const auto& sink : sinks_->items) {
            if (auto vs = std::dynamic_pointer_cast<VectorSink>(sink)) return vs;
        }
        return nullptr;
    }

    std::string name_;
    std::string prefix_;
    std::shared_ptr<SinkList> sinks_;
};
