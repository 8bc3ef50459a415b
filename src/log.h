#pragma once

#include <functional>
#include <string>

namespace panelbridge {

using LogSink = std::function<void(const std::string& line)>;

// Lines are written to the sink (stderr when none is set) and to the log file
// if one is open. Thread-safe.
void logLine(const std::string& msg);
void logDebug(const std::string& msg);

void setLogSink(LogSink sink);
void setDebugLogging(bool enabled);

bool openLogFile(const std::string& path);
void closeLogFile();

}  // namespace panelbridge
