#include "serial_transport.hpp"
#include "portcode_errors.hpp"
#include "portcode_protocol.hpp"
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <termios.h>
#include <sys/ioctl.h>
#include <errno.h>
#include <string.h>
#include <chrono>
#include <thread>
#include <iostream>

SerialTransport::SerialTransport(int writeTimeoutMs)
    : fd(-1), writeTimeoutMs(writeTimeoutMs > 0 ? writeTimeoutMs : 1) {}
SerialTransport::~SerialTransport() { close(); }

static speed_t baudToFlag(int baud)
{
    switch (baud)
    {
    case 9600: return B9600;
    case 19200: return B19200;
    case 38400: return B38400;
    case 57600: return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
    default: return B115200;
    }
}

bool SerialTransport::configurePort(int baudRate)
{
    struct termios tio;
    if (tcgetattr(fd, &tio) != 0)
    {
        std::cerr << "tcgetattr failed: " << strerror(errno) << "\n";
        return false;
    }

    cfmakeraw(&tio);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~CSTOPB;
    tio.c_cflag &= ~CRTSCTS; // no HW flow
    tio.c_iflag = 0;
    tio.c_oflag = 0;
    tio.c_lflag = 0;
    tio.c_cc[VMIN] = 0;
    tio.c_cc[VTIME] = 0;

    speed_t sp = baudToFlag(baudRate);
    cfsetispeed(&tio, sp);
    cfsetospeed(&tio, sp);

    if (tcsetattr(fd, TCSANOW, &tio) != 0)
    {
        std::cerr << "tcsetattr failed: " << strerror(errno) << "\n";
        return false;
    }

    // Start with all trigger lines low
    tcflush(fd, TCIOFLUSH);
    return true;
}

bool SerialTransport::open(const std::string &path, int baudRate)
{
    close();
    fd = ::open(path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0)
    {
        std::cerr << "open(" << path << ") failed: " << strerror(errno) << "\n";
        return false;
    }
    if (!configurePort(baudRate))
    {
        close();
        return false;
    }
    devicePath = path;
    return true;
}

void SerialTransport::close()
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

bool SerialTransport::isOpen() const
{
    return fd >= 0;
}

std::string SerialTransport::name() const
{
    return devicePath.empty() ? std::string("serial (closed)") : devicePath;
}

// tcdrain() has no timeout, so poll the kernel output queue instead.
bool SerialTransport::waitOutputDrained(int budgetMs)
{
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(budgetMs);
    while (true)
    {
        int queued = 0;
        if (ioctl(fd, TIOCOUTQ, &queued) != 0)
            return false;
        if (queued == 0)
            return true;
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::microseconds(200));
    }
}

void SerialTransport::write(uint8_t byte)
{
    if (fd < 0)
        throw TransportWriteError("serial port not open", byte);

    auto start = std::chrono::steady_clock::now();
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    int ready = ::poll(&pfd, 1, writeTimeoutMs);
    if (ready == 0)
        throw TransportWriteError("write timed out after " + std::to_string(writeTimeoutMs) + " ms on " + devicePath, byte);
    if (ready < 0)
        throw TransportWriteError(std::string("poll failed: ") + strerror(errno), byte);
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
        throw TransportWriteError("device " + devicePath + " reported an error", byte);

    ssize_t n = ::write(fd, &byte, 1);
    if (n != 1)
    {
        std::string reason = (n < 0) ? strerror(errno) : "short write";
        throw TransportWriteError("write " + portcode::formatCode(byte) + " failed: " + reason, byte);
    }

    int spentMs = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::steady_clock::now() - start)
                                       .count());
    int budgetMs = writeTimeoutMs - spentMs;
    if (budgetMs < 1)
        budgetMs = 1;
    if (!waitOutputDrained(budgetMs))
        throw TransportWriteError("output did not drain within " + std::to_string(writeTimeoutMs) + " ms on " + devicePath, byte, true);
}

EmulatedTransport::EmulatedTransport(std::ostream &out) : out(out) {}

void EmulatedTransport::write(uint8_t byte)
{
    out << "PORTCODE EMULATE, code is " << portcode::formatCode(byte) << "\n";
    out.flush();
}

void EmulatedTransport::close() {}

std::string EmulatedTransport::name() const
{
    return "emulated";
}
