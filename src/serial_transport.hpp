#pragma once
#include <cstdint>
#include <iostream>
#include <string>

// Byte sink used by the dispatcher. Only the sender thread touches it.
class Transport
{
public:
    virtual ~Transport() {}

    // Writes one byte and returns once it has left the output buffer.
    // Throws TransportWriteError on failure.
    virtual void write(uint8_t byte) = 0;
    virtual void close() = 0;
    virtual std::string name() const = 0;
};

// POSIX serial transport (USB-serial adapter or a parallel-port emulating box).
// Open with a device path like /dev/ttyUSB0, /dev/ttyACM0, or /dev/ttyS0
class SerialTransport : public Transport
{
public:
    explicit SerialTransport(int writeTimeoutMs = 100);
    ~SerialTransport();

    bool open(const std::string &devicePath, int baudRate);
    void close() override;
    bool isOpen() const;
    void write(uint8_t byte) override;
    std::string name() const override;

private:
    int fd;
    int writeTimeoutMs;
    std::string devicePath;
    bool configurePort(int baudRate);
    bool waitOutputDrained(int budgetMs);
};

// Stand-in used when no device can be opened: prints each code instead.
class EmulatedTransport : public Transport
{
public:
    explicit EmulatedTransport(std::ostream &out = std::cout);

    void write(uint8_t byte) override;
    void close() override;
    std::string name() const override;

private:
    std::ostream &out;
};
