// Copyright 2024-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

#include "Logging.hpp"
// std
#include <cstdarg>
#include <cstdio>
#include <utility>
#include <vector>

namespace sgx::core {

static LoggingCallback g_loggingCallback;
static bool g_logVerbose = false;
static bool g_logEchoOutput = false;

static std::string formatMessage(const char *fmt, va_list args)
{
  va_list argsCopy;
  va_copy(argsCopy, args);
  const int size = std::vsnprintf(nullptr, 0, fmt, argsCopy);
  va_end(argsCopy);

  if (size <= 0)
    return {};

  std::vector<char> buf(size_t(size) + 1);
  std::vsnprintf(buf.data(), buf.size(), fmt, args);
  return std::string(buf.data(), size_t(size));
}

static void dispatch(LogLevel level, const char *fmt, va_list args)
{
  if (level == LogLevel::DEBUG && !g_logVerbose)
    return;

  const auto msg = formatMessage(fmt, args);

  if (g_loggingCallback)
    g_loggingCallback(level, msg);

  if (g_logEchoOutput) {
    auto *out = level == LogLevel::ERROR || level == LogLevel::WARNING
        ? stderr
        : stdout;
    std::fprintf(out, "[%s] %s\n", toString(level), msg.c_str());
    std::fflush(out);
  }
}

///////////////////////////////////////////////////////////////////////////////
// Logging configuration //////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

const char *toString(LogLevel level)
{
  switch (level) {
  case LogLevel::STATUS:
    return "STATUS";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::PERF_WARNING:
    return "PERF";
  case LogLevel::ERROR:
    return "ERROR";
  default:
    break;
  }
  return "UNKNOWN";
}

void setLoggingCallback(LoggingCallback cb)
{
  g_loggingCallback = std::move(cb);
}

void setLogToStdout()
{
  g_loggingCallback = {};
  g_logEchoOutput = true;
}

void setLogVerbose(bool enabled)
{
  g_logVerbose = enabled;
}

bool logVerbose()
{
  return g_logVerbose;
}

void setLogEchoOutput(bool enabled)
{
  g_logEchoOutput = enabled;
}

bool logEchoOutput()
{
  return g_logEchoOutput;
}

///////////////////////////////////////////////////////////////////////////////
// Logging functions //////////////////////////////////////////////////////////
///////////////////////////////////////////////////////////////////////////////

#define SGX_LOG_FUNCTION(name, level)                                          \
  void name(const char *fmt, ...)                                              \
  {                                                                            \
    va_list args;                                                              \
    va_start(args, fmt);                                                       \
    dispatch(level, fmt, args);                                                \
    va_end(args);                                                              \
  }

SGX_LOG_FUNCTION(logStatus, LogLevel::STATUS)
SGX_LOG_FUNCTION(logInfo, LogLevel::INFO)
SGX_LOG_FUNCTION(logDebug, LogLevel::DEBUG)
SGX_LOG_FUNCTION(logWarning, LogLevel::WARNING)
SGX_LOG_FUNCTION(logPerfWarning, LogLevel::PERF_WARNING)
SGX_LOG_FUNCTION(logError, LogLevel::ERROR)

#undef SGX_LOG_FUNCTION

} // namespace sgx::core
