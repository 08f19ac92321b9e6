#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace voucher::runtime::config {
class RuntimeConfig;
}

namespace voucher::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const voucher::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Never pass private keys or encoded vouchers as fields.
void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace voucher::observability

#define VOUCHER_LOG_DEBUG(message, ...) ::voucher::observability::LogDebug((message), ##__VA_ARGS__)
#define VOUCHER_LOG_INFO(message, ...) ::voucher::observability::LogInfo((message), ##__VA_ARGS__)
#define VOUCHER_LOG_WARN(message, ...) ::voucher::observability::LogWarn((message), ##__VA_ARGS__)
#define VOUCHER_LOG_ERROR(message, ...) ::voucher::observability::LogError((message), ##__VA_ARGS__)
