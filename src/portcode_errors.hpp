#pragma once
#include <stdexcept>
#include <string>

// Base for everything the dispatcher and its transports throw.
class PortcodeError : public std::runtime_error
{
public:
    explicit PortcodeError(const std::string &what) : std::runtime_error(what) {}
};

// Call made in the wrong dispatcher state (send after close, close from the sender thread).
class InvalidStateError : public PortcodeError
{
public:
    explicit InvalidStateError(const std::string &what) : PortcodeError(what) {}
};

// Code outside 0..255.
class InvalidCodeError : public PortcodeError
{
public:
    explicit InvalidCodeError(const std::string &what) : PortcodeError(what) {}
};

class ConstructionError : public PortcodeError
{
public:
    explicit ConstructionError(const std::string &what) : PortcodeError(what) {}
};

class TransportOpenError : public ConstructionError
{
public:
    explicit TransportOpenError(const std::string &what) : ConstructionError(what) {}
};

// queued(): the byte already reached the driver, only the drain wait failed.
// Such a byte must not be written again.
class TransportWriteError : public PortcodeError
{
public:
    TransportWriteError(const std::string &what, int byte, bool queued = false)
        : PortcodeError(what), byte_(byte), queued_(queued) {}

    int byte() const { return byte_; }
    bool queued() const { return queued_; }

private:
    int byte_;
    bool queued_;
};
