#pragma once
#include "timestamp.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ranger {

// ---------- Levels ----------

/// MCP logging levels (RFC 5424 severities), least severe first.
enum class LogLevel {
    Debug, Info, Notice, Warning, Error, Critical, Alert, Emergency
};

/// Lower-case MCP wire name ("info", "warning", ...).
std::string log_level_to_string(LogLevel level);

/// Accepts the MCP wire names in any letter case.
/// Throws std::invalid_argument for anything else.
LogLevel log_level_from_string(const std::string& s);

/// Upper-case label written in log lines ("INFO", "WARNING", ...).
std::string log_level_label(LogLevel level);

void to_json(nlohmann::json& j, LogLevel level);
void from_json(const nlohmann::json& j, LogLevel& level);

// ---------- Records ----------

struct LogRecord {
    std::string timestamp;
    LogLevel level = LogLevel::Info;
    std::string logger;
    std::string message;
    nlohmann::json extra = nlohmann::json::object();
    std::optional<std::string> exception;
};

/// Render a record as a single JSON line (no trailing newline).
/// Field order: timestamp, level, name, message, extra fields, exception.
/// Extra keys that collide with the fixed fields are dropped.
std::string format_log_record(const LogRecord& record);

// ---------- Sinks ----------

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const LogRecord& record) = 0;
};

/// Writes one line per record to a stream, serialized under a mutex.
class StreamLogSink : public ILogSink {
public:
    explicit StreamLogSink(std::ostream& out);

    void write(const LogRecord& record) override;

private:
    std::mutex mutex_;
    std::ostream& out_;
};

/// Keeps records in memory.
class MemoryLogSink : public ILogSink {
public:
    void write(const LogRecord& record) override;

    [[nodiscard]] std::vector<LogRecord> records() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

// ---------- Context ----------

class Logger;

/// Process-wide logging configuration: one sink, one threshold and one
/// clock. Built once in main() and handed to every component that logs;
/// must outlive all loggers it creates.
class LogContext {
public:
    explicit LogContext(std::shared_ptr<ILogSink> sink,
                        LogLevel min_level = LogLevel::Info,
                        Clock clock = system_clock());

    LogContext(const LogContext&) = delete;
    LogContext& operator=(const LogContext&) = delete;

    [[nodiscard]] Logger logger(std::string name);

    void set_min_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel min_level() const noexcept;
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

    /// Stamp and forward a record to the sink if its level passes.
    void emit(LogLevel level, const std::string& logger, const std::string& message,
              nlohmann::json extra, std::optional<std::string> exception);

private:
    std::shared_ptr<ILogSink> sink_;
    std::atomic<LogLevel> min_level_;
    Clock clock_;
};

/// Named handle onto a LogContext. Cheap to copy.
class Logger {
public:
    Logger(LogContext& context, std::string name);

    void log(LogLevel level, const std::string& message,
             nlohmann::json extra = nlohmann::json::object(),
             std::optional<std::string> exception = std::nullopt) const;

    void debug(const std::string& message, nlohmann::json extra = nlohmann::json::object()) const;
    void info(const std::string& message, nlohmann::json extra = nlohmann::json::object()) const;
    void warning(const std::string& message, nlohmann::json extra = nlohmann::json::object()) const;
    void error(const std::string& message, nlohmann::json extra = nlohmann::json::object(),
               std::optional<std::string> exception = std::nullopt) const;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    LogContext* context_;
    std::string name_;
};

} // namespace ranger
