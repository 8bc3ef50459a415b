#include "log.h"

#include "plugin_config.h"

#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <system_error>

namespace panelbridge {

namespace {

std::mutex g_logMutex;
std::ofstream g_fileLog;
LogSink g_logSink;
std::atomic<bool> g_debugLogging{false};

}  // namespace

void logLine(const std::string& msg) {
    std::string line = "[" + std::string(PLUGIN_LOG_PREFIX) + "] " + msg + "\n";
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_logSink) {
        g_logSink(line);
    } else {
        std::fputs(line.c_str(), stderr);
    }
    if (g_fileLog.is_open()) {
        g_fileLog << line;
        g_fileLog.flush();
    }
}

void logDebug(const std::string& msg) {
    if (!g_debugLogging.load()) {
        return;
    }
    logLine("DEBUG " + msg);
}

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_logSink = std::move(sink);
}

void setDebugLogging(bool enabled) {
    g_debugLogging.store(enabled);
}

bool openLogFile(const std::string& path) {
    bool opened = false;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        if (g_fileLog.is_open()) {
            g_fileLog.close();
        }
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
        g_fileLog.open(path, std::ios::app);
        opened = g_fileLog.is_open();
    }
    if (!opened) {
        logLine("Warning: could not open logfile " + path);
        return false;
    }
    logLine("Logfile opened at " + path);
    return true;
}

void closeLogFile() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_fileLog.is_open()) {
        g_fileLog.close();
    }
}

}  // namespace panelbridge
