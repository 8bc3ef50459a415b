#include "serial_port.h"

#include "log.h"

#if IBM
#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/select.h>
#include <sys/time.h>
#include <termios.h>
#include <unistd.h>
#endif

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace panelbridge {

namespace {

constexpr size_t kMaxPendingLine = 4096;

#if IBM
std::string win32ErrorMessage(DWORD err) {
    if (err == 0) {
        return {};
    }
    LPSTR msgBuf = nullptr;
    DWORD size = FormatMessageA(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr,
        err,
        MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
        reinterpret_cast<LPSTR>(&msgBuf),
        0,
        nullptr);
    std::string msg;
    if (size != 0 && msgBuf) {
        msg.assign(msgBuf, size);
        LocalFree(msgBuf);
    } else {
        msg = "unknown";
    }
    while (!msg.empty() && (msg.back() == '\r' || msg.back() == '\n' || msg.back() == ' ' || msg.back() == '\t')) {
        msg.pop_back();
    }
    return msg;
}
#endif

std::string lastSystemError() {
#if IBM
    DWORD e = GetLastError();
    return "(" + std::to_string(e) + "): " + win32ErrorMessage(e);
#else
    int e = errno;
    return "(" + std::to_string(e) + "): " + std::strerror(e);
#endif
}

void closeHandle(intptr_t handle) {
#if IBM
    HANDLE h = reinterpret_cast<HANDLE>(handle);
    if (h && h != INVALID_HANDLE_VALUE) {
        CloseHandle(h);
    }
#else
    int fd = static_cast<int>(handle);
    if (fd >= 0) {
        ::close(fd);
    }
#endif
}

#if !IBM
speed_t baudToTermios(int baud, bool& ok) {
    ok = true;
    switch (baud) {
        case 1200: return B1200;
        case 2400: return B2400;
        case 4800: return B4800;
        case 9600: return B9600;
        case 19200: return B19200;
        case 38400: return B38400;
        case 57600: return B57600;
        case 115200: return B115200;
#ifdef B230400
        case 230400: return B230400;
#endif
#ifdef B460800
        case 460800: return B460800;
#endif
#ifdef B921600
        case 921600: return B921600;
#endif
    }
    ok = false;
    return B115200;
}
#endif

intptr_t openHandle(const std::string& port, const SerialSettings& serial) {
#if IBM
    std::string device = port;
    // Accept COM3, COM10, and \\.\COM10 formats.
    if (device.rfind("\\\\.", 0) != 0 && device.rfind("COM", 0) == 0) {
        int num = 0;
        try {
            num = std::stoi(device.substr(3));
        } catch (const std::exception&) {
            num = 0;
        }
        if (num >= 10) {
            device = "\\\\.\\" + device;
        }
    }

    HANDLE h = CreateFileA(
        device.c_str(),
        GENERIC_READ | GENERIC_WRITE,
        0,
        nullptr,
        OPEN_EXISTING,
        0,
        nullptr);
    if (h == INVALID_HANDLE_VALUE) {
        return -1;
    }

    SetupComm(h, 4096, 4096);

    DCB dcb{};
    dcb.DCBlength = sizeof(dcb);
    if (!GetCommState(h, &dcb)) {
        CloseHandle(h);
        return -1;
    }

    int dataBits = serial.dataBits;
    if (dataBits < 5 || dataBits > 8) {
        dataBits = 8;
    }
    dcb.BaudRate = static_cast<DWORD>(serial.baud > 0 ? serial.baud : 115200);
    dcb.ByteSize = static_cast<BYTE>(dataBits);
    switch (serial.parity) {
        case SerialParity::Even:
            dcb.Parity = EVENPARITY;
            dcb.fParity = TRUE;
            break;
        case SerialParity::Odd:
            dcb.Parity = ODDPARITY;
            dcb.fParity = TRUE;
            break;
        case SerialParity::None:
            dcb.Parity = NOPARITY;
            dcb.fParity = FALSE;
            break;
    }
    dcb.StopBits = serial.stopBits == 2 ? TWOSTOPBITS : ONESTOPBIT;
    dcb.fBinary = TRUE;
    dcb.fDtrControl = DTR_CONTROL_DISABLE;
    dcb.fRtsControl = RTS_CONTROL_ENABLE;
    dcb.fOutxCtsFlow = FALSE;
    dcb.fOutxDsrFlow = FALSE;
    dcb.fOutX = FALSE;
    dcb.fInX = FALSE;
    dcb.fDsrSensitivity = FALSE;
    dcb.fAbortOnError = FALSE;
    if (!SetCommState(h, &dcb)) {
        CloseHandle(h);
        return -1;
    }

    return reinterpret_cast<intptr_t>(h);
#else
    int fd = ::open(port.c_str(), O_RDWR | O_NOCTTY);
    if (fd < 0) {
        return -1;
    }
    termios t{};
    if (tcgetattr(fd, &t) != 0) {
        ::close(fd);
        return -1;
    }
    cfmakeraw(&t);
    bool baudOk = true;
    speed_t baud = baudToTermios(serial.baud, baudOk);
    if (!baudOk) {
        logLine("Serial: unsupported baud " + std::to_string(serial.baud) + " on " + port + ", using 115200");
    }
    cfsetispeed(&t, baud);
    cfsetospeed(&t, baud);
    t.c_cflag |= (CLOCAL | CREAD);
    t.c_cflag &= ~CSIZE;
    switch (serial.dataBits) {
        case 5: t.c_cflag |= CS5; break;
        case 6: t.c_cflag |= CS6; break;
        case 7: t.c_cflag |= CS7; break;
        case 8: default: t.c_cflag |= CS8; break;
    }
    if (serial.stopBits == 2) t.c_cflag |= CSTOPB;
    else t.c_cflag &= ~CSTOPB;
    if (serial.parity == SerialParity::Even) {
        t.c_cflag |= PARENB;
        t.c_cflag &= ~PARODD;
    } else if (serial.parity == SerialParity::Odd) {
        t.c_cflag |= PARENB;
        t.c_cflag |= PARODD;
    } else {
        t.c_cflag &= ~PARENB;
    }
    t.c_iflag &= ~(IXON | IXOFF | IXANY);
    t.c_cc[VTIME] = 0;
    t.c_cc[VMIN] = 0;
    if (tcsetattr(fd, TCSANOW, &t) != 0) {
        ::close(fd);
        return -1;
    }
    return fd;
#endif
}

// 1 = byte read, 0 = timeout, -1 = error.
int readByteWithTimeout(intptr_t handle, uint8_t& out, int timeoutMs) {
#if IBM
    HANDLE h = reinterpret_cast<HANDLE>(handle);
    COMMTIMEOUTS timeouts{};
    timeouts.ReadIntervalTimeout = MAXDWORD;
    timeouts.ReadTotalTimeoutMultiplier = 0;
    timeouts.ReadTotalTimeoutConstant = static_cast<DWORD>(timeoutMs);
    timeouts.WriteTotalTimeoutMultiplier = 0;
    timeouts.WriteTotalTimeoutConstant = 0;
    if (!SetCommTimeouts(h, &timeouts)) {
        return -1;
    }
    DWORD bytesRead = 0;
    if (!ReadFile(h, &out, 1, &bytesRead, nullptr)) {
        return -1;
    }
    return bytesRead == 1 ? 1 : 0;
#else
    int fd = static_cast<int>(handle);
    fd_set rfds;
    FD_ZERO(&rfds);
    FD_SET(fd, &rfds);
    timeval tv{};
    tv.tv_sec = timeoutMs / 1000;
    tv.tv_usec = (timeoutMs % 1000) * 1000;
    int ret = select(fd + 1, &rfds, nullptr, nullptr, &tv);
    if (ret == 0) {
        return 0;  // timeout
    }
    if (ret < 0) {
        if (errno == EINTR) {
            return 0;
        }
        return -1;
    }
    ssize_t n = ::read(fd, &out, 1);
    if (n == 0) {
        // readable but no data: the device went away
        errno = EIO;
        return -1;
    }
    return n == 1 ? 1 : -1;
#endif
}

bool writeBytes(intptr_t handle, const uint8_t* data, size_t len) {
#if IBM
    HANDLE h = reinterpret_cast<HANDLE>(handle);
    DWORD written = 0;
    if (!WriteFile(h, data, static_cast<DWORD>(len), &written, nullptr)) {
        return false;
    }
    return written == len;
#else
    int fd = static_cast<int>(handle);
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
#endif
}

}  // namespace

std::string serialParityToString(SerialParity parity) {
    switch (parity) {
        case SerialParity::None: return "none";
        case SerialParity::Even: return "even";
        case SerialParity::Odd: return "odd";
    }
    return "unknown";
}

std::string serialSettingsSummary(const SerialSettings& settings) {
    return "baud=" + std::to_string(settings.baud) +
           ", data_bits=" + std::to_string(settings.dataBits) +
           ", parity=" + serialParityToString(settings.parity) +
           ", stop_bits=" + std::to_string(settings.stopBits) +
           ", read_timeout_ms=" + std::to_string(settings.readTimeoutMs);
}

SerialPort::~SerialPort() {
    close();
}

bool SerialPort::open(const std::string& path, const SerialSettings& settings, std::string& err) {
    close();
    intptr_t handle = openHandle(path, settings);
    if (handle < 0) {
        err = lastSystemError();
        return false;
    }
    handle_ = handle;
    settings_ = settings;
    pending_.clear();
    return true;
}

void SerialPort::close() {
    if (handle_ >= 0) {
        closeHandle(handle_);
        handle_ = -1;
    }
    pending_.clear();
}

ReadStatus SerialPort::readLine(std::string& line, char terminator, std::string& err) {
    if (handle_ < 0) {
        err = "port not open";
        return ReadStatus::Error;
    }
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(settings_.readTimeoutMs);
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            return ReadStatus::Timeout;
        }
        uint8_t b = 0;
        int r = readByteWithTimeout(handle_, b, static_cast<int>(remaining));
        if (r == 0) {
            return ReadStatus::Timeout;
        }
        if (r < 0) {
            err = "read error " + lastSystemError();
            return ReadStatus::Error;
        }
        if (static_cast<char>(b) == terminator) {
            line = pending_;
            pending_.clear();
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return ReadStatus::Line;
        }
        if (pending_.size() >= kMaxPendingLine) {
            logDebug("Serial: discarding over-long line");
            pending_.clear();
        }
        pending_.push_back(static_cast<char>(b));
    }
}

bool SerialPort::writeLine(const std::string& line, std::string& err) {
    if (handle_ < 0) {
        err = "port not open";
        return false;
    }
    std::string data = line + "\n";
    if (!writeBytes(handle_, reinterpret_cast<const uint8_t*>(data.data()), data.size())) {
        err = "write error " + lastSystemError();
        return false;
    }
    return true;
}

bool SerialPort::setDataTerminalReady(bool level, std::string& err) {
    if (handle_ < 0) {
        err = "port not open";
        return false;
    }
#if IBM
    HANDLE h = reinterpret_cast<HANDLE>(handle_);
    if (!EscapeCommFunction(h, level ? SETDTR : CLRDTR)) {
        err = "DTR " + lastSystemError();
        return false;
    }
#else
    int fd = static_cast<int>(handle_);
    int status = 0;
    if (ioctl(fd, TIOCMGET, &status) != 0) {
        err = "TIOCMGET " + lastSystemError();
        return false;
    }
    if (level) status |= TIOCM_DTR;
    else status &= ~TIOCM_DTR;
    if (ioctl(fd, TIOCMSET, &status) != 0) {
        err = "TIOCMSET " + lastSystemError();
        return false;
    }
#endif
    return true;
}

bool SerialPort::clearBuffers(std::string& err) {
    if (handle_ < 0) {
        err = "port not open";
        return false;
    }
    pending_.clear();
#if IBM
    HANDLE h = reinterpret_cast<HANDLE>(handle_);
    if (!PurgeComm(h, PURGE_RXCLEAR | PURGE_TXCLEAR)) {
        err = "purge " + lastSystemError();
        return false;
    }
#else
    if (tcflush(static_cast<int>(handle_), TCIOFLUSH) != 0) {
        err = "tcflush " + lastSystemError();
        return false;
    }
#endif
    return true;
}

std::vector<std::string> listSerialPorts() {
    std::vector<std::string> ports;
#if IBM
    char target[512];
    for (int i = 1; i <= 256; ++i) {
        std::string name = "COM" + std::to_string(i);
        if (QueryDosDeviceA(name.c_str(), target, sizeof(target)) != 0) {
            ports.push_back(name + " (" + target + ")");
        }
    }
#else
    namespace fs = std::filesystem;
    std::error_code ec;
    const fs::path byId("/dev/serial/by-id");
    if (fs::is_directory(byId, ec)) {
        for (const auto& entry : fs::directory_iterator(byId, ec)) {
            std::error_code linkEc;
            auto resolved = fs::canonical(entry.path(), linkEc);
            std::string desc = entry.path().string();
            if (!linkEc) {
                desc += " -> " + resolved.string();
            }
            ports.push_back(desc);
        }
    }
    for (const auto& entry : fs::directory_iterator("/dev", ec)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind("ttyUSB", 0) == 0 || name.rfind("ttyACM", 0) == 0 || name.rfind("cu.", 0) == 0) {
            ports.push_back(entry.path().string());
        }
    }
    std::sort(ports.begin(), ports.end());
#endif
    return ports;
}

}  // namespace panelbridge
