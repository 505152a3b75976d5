#pragma once
#include "portcode_errors.hpp"
#include "serial_transport.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

// Shared with the test body so it survives the dispatcher owning the transport.
struct FakeWire
{
    std::mutex m;
    std::condition_variable cv;
    std::vector<uint8_t> writes;
    int writeCalls = 0;
    int closeCalls = 0;
    int failNext = 0;
    int drainTimeoutNext = 0;
    bool stalled = false;
    bool inWrite = false;

    void stall()
    {
        std::lock_guard<std::mutex> lock(m);
        stalled = true;
    }

    void release()
    {
        {
            std::lock_guard<std::mutex> lock(m);
            stalled = false;
        }
        cv.notify_all();
    }

    void failWrites(int n)
    {
        std::lock_guard<std::mutex> lock(m);
        failNext = n;
    }

    // Byte goes out, then the write reports a drain timeout.
    void drainTimeouts(int n)
    {
        std::lock_guard<std::mutex> lock(m);
        drainTimeoutNext = n;
    }

    // Blocks until the sender is parked inside write().
    bool waitInWrite(int timeoutMs = 1000)
    {
        std::unique_lock<std::mutex> lock(m);
        return cv.wait_for(lock, std::chrono::milliseconds(timeoutMs), [this]()
                           { return inWrite; });
    }

    std::vector<uint8_t> snapshot()
    {
        std::lock_guard<std::mutex> lock(m);
        return writes;
    }

    int closes()
    {
        std::lock_guard<std::mutex> lock(m);
        return closeCalls;
    }
};

class FakeTransport : public Transport
{
public:
    explicit FakeTransport(std::shared_ptr<FakeWire> wire) : wire(wire) {}

    void write(uint8_t byte) override
    {
        std::unique_lock<std::mutex> lock(wire->m);
        wire->writeCalls++;
        wire->inWrite = true;
        wire->cv.notify_all();
        wire->cv.wait(lock, [this]()
                      { return !wire->stalled; });
        wire->inWrite = false;
        if (wire->failNext > 0)
        {
            wire->failNext--;
            throw TransportWriteError("injected failure", byte);
        }
        wire->writes.push_back(byte);
        wire->cv.notify_all();
        if (wire->drainTimeoutNext > 0)
        {
            wire->drainTimeoutNext--;
            throw TransportWriteError("injected drain timeout", byte, true);
        }
    }

    void close() override
    {
        std::lock_guard<std::mutex> lock(wire->m);
        wire->closeCalls++;
    }

    std::string name() const override
    {
        return "fake";
    }

private:
    std::shared_ptr<FakeWire> wire;
};
