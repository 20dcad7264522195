//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely and to preload them from a KEY=VALUE file.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <fstream>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return (v != nullptr && *v != '\0') ? std::string(v) : defaultValue;
}

//==========================================================================================================
// LoadEnvFile
// Purpose: Preloads environment variables from a dotenv-style file. Lines are KEY=VALUE; blank lines and
//          lines starting with '#' are ignored; surrounding single or double quotes on VALUE are removed.
//          Variables already present in the environment are left untouched.
// Args:
//   path: File to read.
// Returns:
//   Number of variables set; -1 when the file cannot be opened.
//==========================================================================================================
inline int LoadEnvFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return -1;
    }
    auto trim = [](std::string s) {
        const char* ws = " \t\r\n";
        s.erase(0, s.find_first_not_of(ws));
        auto last = s.find_last_not_of(ws);
        if (last == std::string::npos) {
            return std::string();
        }
        s.erase(last + 1);
        return s;
    };
    int count = 0;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        if (key.empty() || std::getenv(key.c_str()) != nullptr) {
            continue;
        }
        if (::setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++count;
        }
    }
    return count;
}
