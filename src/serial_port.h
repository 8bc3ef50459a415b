#pragma once

#include "serial_transport.h"

#include <cstdint>
#include <string>
#include <vector>

namespace panelbridge {

// SerialTransport over a real serial device (termios or Win32 comm API).
class SerialPort : public SerialTransport {
public:
    SerialPort() = default;
    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;
    ~SerialPort() override;

    bool open(const std::string& path, const SerialSettings& settings, std::string& err) override;
    void close() override;
    bool isOpen() const override { return handle_ >= 0; }

    ReadStatus readLine(std::string& line, char terminator, std::string& err) override;
    bool writeLine(const std::string& line, std::string& err) override;

    bool setDataTerminalReady(bool level, std::string& err) override;
    bool clearBuffers(std::string& err) override;

private:
    intptr_t handle_ = -1;
    SerialSettings settings_;
    std::string pending_;
};

// Serial devices present on this machine, best effort.
std::vector<std::string> listSerialPorts();

}  // namespace panelbridge
