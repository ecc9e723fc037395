#include "ranger/logging.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ranger {

// ---------- Levels ----------

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:     return "debug";
        case LogLevel::Info:      return "info";
        case LogLevel::Notice:    return "notice";
        case LogLevel::Warning:   return "warning";
        case LogLevel::Error:     return "error";
        case LogLevel::Critical:  return "critical";
        case LogLevel::Alert:     return "alert";
        case LogLevel::Emergency: return "emergency";
        default:                  return "info";
    }
}

LogLevel log_level_from_string(const std::string& s) {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug")     return LogLevel::Debug;
    if (lower == "info")      return LogLevel::Info;
    if (lower == "notice")    return LogLevel::Notice;
    if (lower == "warning")   return LogLevel::Warning;
    if (lower == "error")     return LogLevel::Error;
    if (lower == "critical")  return LogLevel::Critical;
    if (lower == "alert")     return LogLevel::Alert;
    if (lower == "emergency") return LogLevel::Emergency;
    throw std::invalid_argument("Unknown log level: " + s);
}

std::string log_level_label(LogLevel level) {
    std::string label = log_level_to_string(level);
    std::transform(label.begin(), label.end(), label.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return label;
}

void to_json(nlohmann::json& j, LogLevel level) {
    j = log_level_to_string(level);
}

void from_json(const nlohmann::json& j, LogLevel& level) {
    level = log_level_from_string(j.get<std::string>());
}

// ---------- Records ----------

std::string format_log_record(const LogRecord& record) {
    nlohmann::ordered_json line;
    line["timestamp"] = record.timestamp;
    line["level"] = log_level_label(record.level);
    line["name"] = record.logger;
    line["message"] = record.message;

    if (record.extra.is_object()) {
        for (auto it = record.extra.begin(); it != record.extra.end(); ++it) {
            if (line.contains(it.key()) || it.key() == "exception") continue;
            line[it.key()] = nlohmann::ordered_json(it.value());
        }
    }
    if (record.exception) {
        line["exception"] = *record.exception;
    }
    // Invalid UTF-8 in user-supplied strings must not cost the log line.
    return line.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

// ---------- Sinks ----------

StreamLogSink::StreamLogSink(std::ostream& out) : out_(out) {}

void StreamLogSink::write(const LogRecord& record) {
    std::string line = format_log_record(record);
    line += '\n';
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line;
    out_.flush();
}

void MemoryLogSink::write(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
}

std::vector<LogRecord> MemoryLogSink::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

void MemoryLogSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

// ---------- LogContext ----------

LogContext::LogContext(std::shared_ptr<ILogSink> sink, LogLevel min_level, Clock clock)
    : sink_(std::move(sink)), min_level_(min_level), clock_(std::move(clock)) {
    if (!sink_) {
        throw std::invalid_argument("LogContext requires a sink");
    }
    if (!clock_) {
        clock_ = system_clock();
    }
}

Logger LogContext::logger(std::string name) {
    return Logger(*this, std::move(name));
}

void LogContext::set_min_level(LogLevel level) noexcept {
    min_level_ = level;
}

LogLevel LogContext::min_level() const noexcept {
    return min_level_.load();
}

bool LogContext::enabled(LogLevel level) const noexcept {
    return level >= min_level_.load();
}

void LogContext::emit(LogLevel level, const std::string& logger, const std::string& message,
                      nlohmann::json extra, std::optional<std::string> exception) {
    if (!enabled(level)) return;

    LogRecord record;
    record.timestamp = format_iso8601(clock_());
    record.level = level;
    record.logger = logger;
    record.message = message;
    record.extra = extra.is_object() ? std::move(extra) : nlohmann::json::object();
    record.exception = std::move(exception);
    sink_->write(record);
}

// ---------- Logger ----------

Logger::Logger(LogContext& context, std::string name)
    : context_(&context), name_(std::move(name)) {}

void Logger::log(LogLevel level, const std::string& message, nlohmann::json extra,
                 std::optional<std::string> exception) const {
    context_->emit(level, name_, message, std::move(extra), std::move(exception));
}

void Logger::debug(const std::string& message, nlohmann::json extra) const {
    log(LogLevel::Debug, message, std::move(extra));
}

void Logger::info(const std::string& message, nlohmann::json extra) const {
    log(LogLevel::Info, message, std::move(extra));
}

void Logger::warning(const std::string& message, nlohmann::json extra) const {
    log(LogLevel::Warning, message, std::move(extra));
}

void Logger::error(const std::string& message, nlohmann::json extra,
                   std::optional<std::string> exception) const {
    log(LogLevel::Error, message, std::move(extra), std::move(exception));
}

} // namespace ranger
