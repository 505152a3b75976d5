#pragma once
#include "portcode_errors.hpp"
#include "serial_transport.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct DispatcherConfig
{
    std::string port = "/dev/ttyUSB0";
    int baudRate = 115200;
    bool emulateOnFail = true;
    int writeRetries = 3;    // extra attempts after the first failed write
    int retryDelayMs = 2;
    int writeTimeoutMs = 100;
    bool verbose = false;
};

enum class DispatcherState
{
    Running,
    Closing,
    Closed
};

struct DispatcherStats
{
    uint64_t codesSubmitted = 0;
    uint64_t flushesSubmitted = 0;
    uint64_t bytesWritten = 0;
    uint64_t writeFailures = 0; // failed attempts, retries included
    uint64_t bytesDropped = 0;
};

// TriggerDispatcher sends EEG trigger portcodes without blocking the caller.
// sendPortcode() only enqueues; one background thread owns the transport,
// ORs together every code queued since its last write and writes the result
// as one byte. Code 0 is a flush: codes before it are written first, codes
// after it are never merged into that write.
class TriggerDispatcher
{
public:
    using ErrorCallback = std::function<void(const TransportWriteError &, int attempt)>;

    // Opens config.port; falls back to an EmulatedTransport when the port
    // can't be opened and emulateOnFail is set, else throws TransportOpenError.
    explicit TriggerDispatcher(const DispatcherConfig &config);
    TriggerDispatcher(std::unique_ptr<Transport> transport, const DispatcherConfig &config);
    ~TriggerDispatcher();

    TriggerDispatcher(const TriggerDispatcher &) = delete;
    TriggerDispatcher &operator=(const TriggerDispatcher &) = delete;

    // Non-blocking. Throws InvalidStateError once close() has begun and
    // InvalidCodeError outside 0..255.
    void sendPortcode(int code);
    // Same as sendPortcode(0).
    void clear();
    // Blocks until the sender has exited and the transport is closed. Idempotent.
    void close();

    // Blocks the caller until every request submitted so far is processed.
    // Returns false if timeoutMs elapsed first.
    bool waitUntilSent(int timeoutMs);

    // Called on the sender thread for every failed write attempt (1-based).
    // Must not call close().
    void setErrorCallback(ErrorCallback cb);

    DispatcherState state() const;
    DispatcherStats stats() const;
    std::string transportName() const;

private:
    DispatcherConfig config_;
    std::unique_ptr<Transport> transport_;
    std::string transportName_;

    mutable std::mutex mutex_;
    std::condition_variable workCv_;
    std::condition_variable idleCv_;
    std::deque<uint8_t> queue_;
    DispatcherState state_;
    bool busy_; // sender holds a batch or a carried tail
    DispatcherStats stats_;
    ErrorCallback onError_;

    std::mutex closeMutex_;
    std::thread sender_;
    std::thread::id senderId_;

    void start();
    void senderLoop();
    // Writes everything up to the first flush, returns the requests after it.
    std::vector<uint8_t> processBatch(const std::vector<uint8_t> &batch);
    void writeWithRetry(uint8_t byte);
    void reportError(const TransportWriteError &err, int attempt);
};
