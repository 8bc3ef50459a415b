#pragma once

#include <string>

namespace panelbridge {

enum class SerialParity { None, Even, Odd };

struct SerialSettings {
    int baud = 115200;
    int dataBits = 8;
    int stopBits = 1;
    SerialParity parity = SerialParity::None;
    int readTimeoutMs = 10;
};

enum class ReadStatus { Line, Timeout, Error };

// Byte stream to one panel. Implementations buffer partial lines between
// readLine calls.
class SerialTransport {
public:
    virtual ~SerialTransport() = default;

    virtual bool open(const std::string& path, const SerialSettings& settings, std::string& err) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Reads until `terminator` or until the settings' read timeout elapses.
    // Line: `line` holds the content without the terminator and trailing '\r'.
    virtual ReadStatus readLine(std::string& line, char terminator, std::string& err) = 0;
    // Writes `line` followed by '\n'.
    virtual bool writeLine(const std::string& line, std::string& err) = 0;

    virtual bool setDataTerminalReady(bool level, std::string& err) = 0;
    virtual bool clearBuffers(std::string& err) = 0;
};

std::string serialParityToString(SerialParity parity);
std::string serialSettingsSummary(const SerialSettings& settings);

}  // namespace panelbridge
