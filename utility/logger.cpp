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

#include "logger.h"
#include "helpers.h"
#include <boost/filesystem.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <stdexcept>
#include <mutex>
#include <algorithm>
#include <string.h>

namespace xbridge {

namespace {

constexpr size_t MAX_HEADER_SIZE = 256;
constexpr size_t MAX_TIMESTAMP_SIZE = 64;
constexpr size_t MAX_MSG_SIZE = 10000;

std::mutex g_WriteMutex;

// per-thread message buffer, reused across messages
struct LogThreadContext {
    using Formatter = boost::iostreams::filtering_ostream;

    std::string msgBuffer;
    std::unique_ptr<Formatter> formatter;

    LogThreadContext() {
        reset();
    }

    void reset() {
        formatter.reset();
        msgBuffer = std::string();
        msgBuffer.reserve(MAX_MSG_SIZE);
        formatter = std::make_unique<Formatter>(boost::iostreams::back_inserter(msgBuffer));
    }
};

LogThreadContext& get_context() {
    static thread_local LogThreadContext ctx;
    return ctx;
}

size_t format_header(char* buf, const LogMessageHeader& header) {
    char ts[MAX_TIMESTAMP_SIZE];
    format_timestamp(ts, sizeof(ts), "%Y-%m-%d.%T", header.timestamp);

    int n = header.line ?
        snprintf(buf, MAX_HEADER_SIZE, "%c %s (%s, %s:%d) ", loglevel_tag(header.level), ts, header.func, header.file, header.line) :
        snprintf(buf, MAX_HEADER_SIZE, "%c %s ", loglevel_tag(header.level), ts);

    if (n < 0)
        return 0;
    return std::min(static_cast<size_t>(n), MAX_HEADER_SIZE - 1);
}

} //namespace

char loglevel_tag(int level) {
    static const char tags[] = "~VDIWEC";
    if (level < 0 || level >= static_cast<int>(sizeof(tags) - 1))
        level = 0;
    return tags[level];
}

struct Logger::Sink {
    FILE* pFile;
    int level;
    bool owned;

    Sink(FILE* p, int lvl, bool bOwned) : pFile(p), level(lvl), owned(bOwned) {}

    ~Sink() {
        if (owned && pFile)
            fclose(pFile);
    }

    void write(const char* header, size_t headerSize, const char* msg, size_t size, bool bFlush) {
        fwrite(header, 1, headerSize, pFile);
        fwrite(msg, 1, size, pFile);
        if (bFlush)
            fflush(pFile);
    }
};

Logger* Logger::s_pInstance = nullptr;

Logger::Logger(int flushLevel, int consoleLevel, int fileLevel)
    : m_FlushLevel(flushLevel)
    , m_MinLevel(LOG_LEVEL_CRITICAL + 1)
{
    if (consoleLevel > LOG_SINK_DISABLED) {
        m_pConsole = std::make_unique<Sink>(stdout, consoleLevel, false);
        m_MinLevel = std::min(m_MinLevel, consoleLevel);
    }
    if (fileLevel > LOG_SINK_DISABLED)
        m_MinLevel = std::min(m_MinLevel, fileLevel);
}

Logger::~Logger() {
    if (this == s_pInstance)
        s_pInstance = nullptr;
}

void Logger::OpenFile(const std::string& fileNamePrefix, const std::string& dstPath, int level) {
    std::string fileName = fileNamePrefix + format_timestamp("%y_%m_%d_%H_%M_%S", local_timestamp_msec(), false) + ".log";

    boost::filesystem::path path(fileName);
    if (!dstPath.empty()) {
        boost::filesystem::path dir(dstPath);
        if (!boost::filesystem::exists(dir))
            boost::filesystem::create_directories(dir);
        path = dir / fileName;
    }

    m_FilePath = path.string();

    FILE* pFile = fopen(m_FilePath.c_str(), "ab");
    if (!pFile)
        throw std::runtime_error("cannot open log file " + m_FilePath);

    m_pFile = std::make_unique<Sink>(pFile, level, true);
}

std::shared_ptr<Logger> Logger::create(
    int flushLevel,
    int consoleLevel,
    int fileLevel,
    const std::string& fileNamePrefix,
    const std::string& dstPath
) {
    if (s_pInstance)
        throw std::runtime_error("logger already initialized");

    if ((consoleLevel <= LOG_SINK_DISABLED) && (fileLevel <= LOG_SINK_DISABLED))
        throw std::runtime_error("no logger sink configured");

    std::shared_ptr<Logger> logger(new Logger(flushLevel, consoleLevel, fileLevel));
    if (fileLevel > LOG_SINK_DISABLED)
        logger->OpenFile(fileNamePrefix, dstPath, fileLevel);

    s_pInstance = logger.get();
    return logger;
}

void Logger::Write(const LogMessageHeader& header, const char* buf, size_t size) {
    char headerFormatted[MAX_HEADER_SIZE];
    size_t headerSize = format_header(headerFormatted, header);
    bool bFlush = (header.level >= m_FlushLevel);

    std::lock_guard<std::mutex> lock(g_WriteMutex);

    for (Sink* pSink : { m_pConsole.get(), m_pFile.get() }) {
        if (pSink && (header.level >= pSink->level))
            pSink->write(headerFormatted, headerSize, buf, size, bFlush);
    }
}

LogMessageHeader::LogMessageHeader(int _level, const char* _file, int _line, const char* _func) :
    timestamp(local_timestamp_msec()),
    func(_func ? _func : ""),
    file(_file ? _file : ""),
    line(_line),
    level(_level)
{
    // strip the directories
    const char* sz = strrchr(file, '/');
    if (sz)
        file = sz + 1;
}

LogMessage::LogMessage(int _level, const char* _file, int _line, const char* _func) :
    header(_level, _file, _line, _func)
{
    _formatter = get_context().formatter.get();
}

LogMessage::~LogMessage() {
    LogThreadContext& ctx = get_context();

    *_formatter << '\n';
    _formatter->flush();

    if (Logger::s_pInstance)
        Logger::s_pInstance->Write(header, ctx.msgBuffer.data(), ctx.msgBuffer.size());

    if (ctx.msgBuffer.size() > MAX_MSG_SIZE)
        ctx.reset();
    else
        ctx.msgBuffer.clear();
}

} //namespace
