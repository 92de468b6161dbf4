#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace spdlog {
class logger;
}

namespace strata::runtime::config {
class RuntimeConfig;
}

namespace strata::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DurationField(std::string_view key, std::chrono::nanoseconds value);
LogField ErrorField(std::string_view message);

void InitializeLogging(const strata::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

/*
  Logger

  Value type binding a sink and a fixed set of fields. Copies are cheap
  and independent: WithField() never mutates the receiver.

  A default-constructed Logger writes through spdlog's default logger as
  it is at call time, so InitializeLogging() may run after the Logger was
  created.
*/
class Logger {
 public:
  Logger() = default;
  explicit Logger(std::shared_ptr<spdlog::logger> sink, std::vector<LogField> fields = {});

  static Logger Default();
  // Drops everything; for internal calls whose failures are expected.
  static Logger Discard();

  Logger WithField(LogField field) const;
  Logger WithFields(std::initializer_list<LogField> fields) const;
  Logger WithFields(const std::vector<LogField>& fields) const;

  const std::vector<LogField>& Fields() const {
    return fields_;
  }

  void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {}) const;

  void Trace(std::string_view message, std::initializer_list<LogField> fields = {}) const {
    Log(spdlog::level::trace, message, fields);
  }
  void Debug(std::string_view message, std::initializer_list<LogField> fields = {}) const {
    Log(spdlog::level::debug, message, fields);
  }
  void Info(std::string_view message, std::initializer_list<LogField> fields = {}) const {
    Log(spdlog::level::info, message, fields);
  }
  void Warn(std::string_view message, std::initializer_list<LogField> fields = {}) const {
    Log(spdlog::level::warn, message, fields);
  }
  void Error(std::string_view message, std::initializer_list<LogField> fields = {}) const {
    Log(spdlog::level::err, message, fields);
  }

 private:
  std::shared_ptr<spdlog::logger> sink_;
  std::vector<LogField>           fields_;
};

} // namespace strata::observability

#define STRATA_LOG_ERROR(message, ...) ::strata::observability::LogError((message), ##__VA_ARGS__)
