//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger state, level parsing, console/file output and sink dispatch.
//==========================================================================================================

#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <errno.h>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "logging/Logger.h"
#include "env/EnvVars.h"

LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
Logger::Sink Logger::sSink;

namespace {
    bool envFlag(const char* name, const char* defaultValue) {
        const std::string v = GetEnvOrDefault(name, defaultValue);
        return v == "1" || v == "true" || v == "TRUE";
    }

    // ANSI color for the level label
    const char* labelColorFor(const char* level) {
        if (::strncmp(level, "ERROR", 5) == 0 || ::strncmp(level, "FATAL", 5) == 0) {
            return "\033[38;5;88m"; // burgundy
        }
        if (::strncmp(level, "WARN", 4) == 0) {
            return "\033[33m";      // amber
        }
        return "\033[35m";          // purple
    }
}

LogLevel Logger::levelFromString(const std::string& lvl) {
    std::string s;
    s.reserve(lvl.size());
    for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
    if (s == "INFO")  return LogLevel::LOG_INFO_LEVEL;
    if (s == "WARN" || s == "WARNING") return LogLevel::LOG_WARN_LEVEL;
    if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
    if (s == "FATAL") return LogLevel::LOG_FATAL_LEVEL;
    return LogLevel::LOG_DEBUG_LEVEL;
}

void Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return;
    }
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm buf{};
    ::localtime_r(&now, &buf);
    sLogFile << "\n=== authgate log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
    sLogFile.flush();
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    sSink = std::move(sink);
}

void Logger::log(const char* level, const std::string& msg, const char* file, unsigned int line) {
    // AUTHGATE_LOG_COLOR colors the label only; AUTHGATE_LOG_STDERR keeps stdout free for program output
    static const bool colorEnabled = envFlag("AUTHGATE_LOG_COLOR", "1");
    static const bool useStderr = envFlag("AUTHGATE_LOG_STDERR", "0");

    std::ostringstream oss;
    if (colorEnabled) {
        oss << "[" << labelColorFor(level) << level << "\033[0m] ";
    } else {
        oss << "[" << level << "] ";
    }
    oss << file << ":" << line << ": " << msg << '\n';
    const std::string record = oss.str();

    Sink sink;
    {
        std::lock_guard<std::mutex> lock(sLogMutex);
        (useStderr ? std::cerr : std::cout) << record << std::flush;
        if (sLogFile.is_open()) {
            sLogFile << record;
            sLogFile.flush();
        }
        sink = sSink;
    }
    // Invoked unlocked: a sink may itself log or call setSink
    if (sink) {
        sink(level, msg);
    }
}
