// Copyright 2024-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// std
#include <functional>
#include <string>

namespace sgx::core {

enum class LogLevel
{
  STATUS,
  INFO,
  DEBUG,
  WARNING,
  PERF_WARNING,
  ERROR,
  UNKNOWN
};

using LoggingCallback = std::function<void(LogLevel, const std::string &)>;

const char *toString(LogLevel level);

// Install a callback which receives every formatted message. An empty
// callback restores the default (messages are dropped unless echoed).
void setLoggingCallback(LoggingCallback cb);
void setLogToStdout();

void setLogVerbose(bool enabled);
bool logVerbose();
void setLogEchoOutput(bool enabled);
bool logEchoOutput();

void logStatus(const char *fmt, ...);
void logInfo(const char *fmt, ...);
void logDebug(const char *fmt, ...);
void logWarning(const char *fmt, ...);
void logPerfWarning(const char *fmt, ...);
void logError(const char *fmt, ...);

} // namespace sgx::core
