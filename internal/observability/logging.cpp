#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>
#include <utility>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace strata::observability {
namespace {

std::string ResolveLevel(const strata::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("STRATA_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const strata::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("STRATA_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

void AppendFields(std::ostringstream& out, bool& first, const std::vector<LogField>& fields) {
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
}

void AppendFields(std::ostringstream& out, bool& first, std::initializer_list<LogField> fields) {
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
}

void Emit(spdlog::logger& sink, spdlog::level::level_enum level, std::string_view message, const std::vector<LogField>& bound,
          std::initializer_list<LogField> fields) {
  if (!sink.should_log(level)) {
    return;
  }

  std::ostringstream out;
  bool               first = true;
  AppendFields(out, first, bound);
  AppendFields(out, first, fields);

  auto serialized_fields = out.str();
  if (serialized_fields.empty()) {
    sink.log(level, "{}", message);
    return;
  }
  sink.log(level, "{} {}", message, serialized_fields);
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DurationField(std::string_view key, std::chrono::nanoseconds value) {
  return {std::string(key), util::FormatDuration(std::chrono::duration_cast<util::Duration>(value))};
}

LogField ErrorField(std::string_view message) {
  return {"error", std::string(message)};
}

void InitializeLogging(const strata::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::stdout_color_mt("strata-db");
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  Emit(*spdlog::default_logger_raw(), level, message, {}, fields);
}

Logger::Logger(std::shared_ptr<spdlog::logger> sink, std::vector<LogField> fields) : sink_(std::move(sink)), fields_(std::move(fields)) {
}

Logger Logger::Default() {
  return Logger{};
}

Logger Logger::Discard() {
  static const auto null_logger = std::make_shared<spdlog::logger>("discard", std::make_shared<spdlog::sinks::null_sink_mt>());
  return Logger(null_logger);
}

Logger Logger::WithField(LogField field) const {
  Logger derived = *this;
  derived.fields_.push_back(std::move(field));
  return derived;
}

Logger Logger::WithFields(std::initializer_list<LogField> fields) const {
  Logger derived = *this;
  derived.fields_.insert(derived.fields_.end(), fields.begin(), fields.end());
  return derived;
}

Logger Logger::WithFields(const std::vector<LogField>& fields) const {
  Logger derived = *this;
  derived.fields_.insert(derived.fields_.end(), fields.begin(), fields.end());
  return derived;
}

void Logger::Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) const {
  auto* sink = sink_ ? sink_.get() : spdlog::default_logger_raw();
  Emit(*sink, level, message, fields_, fields);
}

} // namespace strata::observability
