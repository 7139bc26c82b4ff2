// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once
#include <iostream>
#include <memory>
#include <string>
#include <stdint.h>
#include <stdio.h>

#ifndef LOG_VERBOSE_ENABLED
    #define LOG_VERBOSE_ENABLED 0
#endif

#ifndef LOG_DEBUG_ENABLED
    #ifndef NDEBUG
        #define LOG_DEBUG_ENABLED 1
    #else
        #define LOG_DEBUG_ENABLED 0
    #endif
#endif

#ifndef SHOW_CODE_LOCATION
    #define SHOW_CODE_LOCATION 0
#endif

#define LOG_LEVEL_CRITICAL 6
#define LOG_LEVEL_ERROR    5
#define LOG_LEVEL_WARNING  4
#define LOG_LEVEL_INFO     3
#define LOG_LEVEL_DEBUG    2
#define LOG_LEVEL_VERBOSE  1

#define LOG_SINK_DISABLED  0

// Swallows the message when the level is compiled out
struct LogMessageStub {
    template <typename T> LogMessageStub& operator<<(const T&) { return *this; }
};

#if SHOW_CODE_LOCATION
    #define LOG_MESSAGE(LEVEL) if (xbridge::Logger::will_log(LEVEL)) xbridge::LogMessage(LEVEL, __FILE__, __LINE__, __FUNCTION__)
#else
    #define LOG_MESSAGE(LEVEL) if (xbridge::Logger::will_log(LEVEL)) xbridge::LogMessage(LEVEL)
#endif

#define LOG_CRITICAL() LOG_MESSAGE(LOG_LEVEL_CRITICAL)
#define LOG_ERROR() LOG_MESSAGE(LOG_LEVEL_ERROR)
#define LOG_WARNING() LOG_MESSAGE(LOG_LEVEL_WARNING)
#define LOG_INFO() LOG_MESSAGE(LOG_LEVEL_INFO)

#if LOG_DEBUG_ENABLED
    #define LOG_DEBUG() LOG_MESSAGE(LOG_LEVEL_DEBUG)
#else
    #define LOG_DEBUG() LogMessageStub()
#endif

#if LOG_VERBOSE_ENABLED
    #define LOG_VERBOSE() LOG_MESSAGE(LOG_LEVEL_VERBOSE)
#else
    #define LOG_VERBOSE() LogMessageStub()
#endif

namespace xbridge {

struct LogMessageHeader {
    uint64_t timestamp;
    const char* func;
    const char* file;
    int line;
    int level;

    LogMessageHeader(int _level, const char* _file, int _line, const char* _func);
};

// One letter per level, '~' for out of range
char loglevel_tag(int level);

// Process-wide logger. At most one instance exists, messages are dropped while there's none.
// Writes to the console and/or a file, each with its own minimal level.
class Logger {
public:
    // RAII, the instance is uninstalled when the last reference goes
    static std::shared_ptr<Logger> create(
        // sinks are flushed on messages of this level and above
        int flushLevel = LOG_LEVEL_WARNING,

        // LOG_SINK_DISABLED to disable
        int consoleLevel = LOG_LEVEL_DEBUG,
        int fileLevel = LOG_SINK_DISABLED,

        // file name is prefix + creation time + ".log", dstPath is created if missing
        const std::string& fileNamePrefix = std::string(),
        const std::string& dstPath = std::string()
    );

    ~Logger();

    // empty if the file sink is disabled
    const std::string& get_current_file_name() const { return m_FilePath; }

    static bool will_log(int level) {
        return s_pInstance && (level >= s_pInstance->m_MinLevel);
    }

private:
    friend class LogMessage;

    struct Sink;

    Logger(int flushLevel, int consoleLevel, int fileLevel);

    void OpenFile(const std::string& fileNamePrefix, const std::string& dstPath, int level);
    void Write(const LogMessageHeader&, const char* buf, size_t size);

    std::unique_ptr<Sink> m_pConsole;
    std::unique_ptr<Sink> m_pFile;
    std::string m_FilePath;
    int m_FlushLevel;
    int m_MinLevel;

    static Logger* s_pInstance;
};

// Collects the message via operator<< and hands it to the logger in the destructor
class LogMessage {
public:
    LogMessageHeader header;

    LogMessage(int _level, const char* _file = nullptr, int _line = 0, const char* _func = nullptr);
    ~LogMessage();

    LogMessage(const LogMessage&) = delete;
    LogMessage& operator=(const LogMessage&) = delete;

    template <class T> LogMessage& operator<<(const T& x) {
        *_formatter << x;
        return *this;
    }

private:
    std::ostream* _formatter = nullptr;
};

} //namespace
