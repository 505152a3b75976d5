#include "trigger_dispatcher.hpp"
#include "portcode_protocol.hpp"
#include <chrono>
#include <iostream>

static DispatcherConfig sanitize(const DispatcherConfig &in)
{
    DispatcherConfig cfg = in;
    if (cfg.writeRetries < 0)
        cfg.writeRetries = 0;
    if (cfg.retryDelayMs < 0)
        cfg.retryDelayMs = 0;
    if (cfg.writeTimeoutMs < 1)
        cfg.writeTimeoutMs = 1;
    return cfg;
}

TriggerDispatcher::TriggerDispatcher(const DispatcherConfig &config)
    : config_(sanitize(config)), state_(DispatcherState::Running), busy_(false)
{
    if (config_.port.empty())
        throw ConstructionError("empty serial port identifier");

    auto serial = std::make_unique<SerialTransport>(config_.writeTimeoutMs);
    if (serial->open(config_.port, config_.baudRate))
    {
        std::cout << "✓ Serial connected: " << config_.port << " @" << config_.baudRate << "\n";
        transport_ = std::move(serial);
    }
    else if (config_.emulateOnFail)
    {
        std::cerr << "WARN: Could not open device " << config_.port
                  << ". No portcodes will be sent, but they will be emulated on stdout.\n";
        transport_ = std::make_unique<EmulatedTransport>();
    }
    else
    {
        throw TransportOpenError("cannot open " + config_.port + " @" + std::to_string(config_.baudRate));
    }
    start();
}

TriggerDispatcher::TriggerDispatcher(std::unique_ptr<Transport> transport, const DispatcherConfig &config)
    : config_(sanitize(config)), transport_(std::move(transport)), state_(DispatcherState::Running), busy_(false)
{
    if (!transport_)
        throw ConstructionError("null transport");
    start();
}

TriggerDispatcher::~TriggerDispatcher()
{
    close();
}

void TriggerDispatcher::start()
{
    transportName_ = transport_->name();
    // senderLoop takes mutex_ first, so it can't observe senderId_ unset
    std::lock_guard<std::mutex> lock(mutex_);
    sender_ = std::thread(&TriggerDispatcher::senderLoop, this);
    senderId_ = sender_.get_id();
}

void TriggerDispatcher::sendPortcode(int code)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != DispatcherState::Running)
            throw InvalidStateError("sendPortcode(" + std::to_string(code) + ") after close()");
        if (!portcode::isValidCode(code))
            throw InvalidCodeError("portcode " + std::to_string(code) + " outside " +
                                   std::to_string(portcode::kMinCode) + ".." + std::to_string(portcode::kMaxCode));
        queue_.push_back(static_cast<uint8_t>(code));
        if (portcode::isFlush(code))
            stats_.flushesSubmitted++;
        else
            stats_.codesSubmitted++;
    }
    workCv_.notify_one();
}

void TriggerDispatcher::clear()
{
    sendPortcode(portcode::kFlushCode);
}

void TriggerDispatcher::close()
{
    std::thread::id senderId;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == DispatcherState::Closed)
            return;
        senderId = senderId_;
    }
    if (std::this_thread::get_id() == senderId)
        throw InvalidStateError("close() called from the sender thread");

    std::lock_guard<std::mutex> closeLock(closeMutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == DispatcherState::Closed)
            return;
        state_ = DispatcherState::Closing;
    }
    workCv_.notify_all();
    if (sender_.joinable())
        sender_.join();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = DispatcherState::Closed;
        // thread ids get reused once the sender is joined
        senderId_ = std::thread::id();
    }
    idleCv_.notify_all();
    if (config_.verbose)
        std::cout << "✓ Portcode dispatcher closed (" << transportName_ << ")\n";
}

bool TriggerDispatcher::waitUntilSent(int timeoutMs)
{
    std::unique_lock<std::mutex> lock(mutex_);
    return idleCv_.wait_for(lock, std::chrono::milliseconds(timeoutMs < 0 ? 0 : timeoutMs), [this]()
                            { return (queue_.empty() && !busy_) || state_ == DispatcherState::Closed; });
}

void TriggerDispatcher::setErrorCallback(ErrorCallback cb)
{
    std::lock_guard<std::mutex> lock(mutex_);
    onError_ = std::move(cb);
}

DispatcherState TriggerDispatcher::state() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

DispatcherStats TriggerDispatcher::stats() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::string TriggerDispatcher::transportName() const
{
    return transportName_;
}

void TriggerDispatcher::senderLoop()
{
    if (config_.verbose)
        std::cout << "✓ Portcode sender started (" << transportName_ << ")\n";

    // Requests that followed a flush in the previous pass
    std::vector<uint8_t> carried;
    while (true)
    {
        std::vector<uint8_t> batch;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (carried.empty())
            {
                busy_ = false;
                if (queue_.empty())
                    idleCv_.notify_all();
                workCv_.wait(lock, [this]()
                             { return !queue_.empty() || state_ != DispatcherState::Running; });
                // Closing and fully drained
                if (queue_.empty())
                    break;
            }
            batch.swap(carried);
            batch.insert(batch.end(), queue_.begin(), queue_.end());
            queue_.clear();
            busy_ = true;
        }
        carried = processBatch(batch);
    }

    transport_->close();
    if (config_.verbose)
        std::cout << "✓ Portcode sender stopped, " << transportName_ << " released\n";
}

std::vector<uint8_t> TriggerDispatcher::processBatch(const std::vector<uint8_t> &batch)
{
    std::vector<uint8_t> codes;
    size_t i = 0;
    for (; i < batch.size() && !portcode::isFlush(batch[i]); ++i)
    {
        if (config_.verbose && !portcode::isSingleLine(batch[i]))
            std::cout << "[PORTCODE] note: " << portcode::formatCode(batch[i]) << " drives more than one line\n";
        codes.push_back(batch[i]);
    }

    if (!codes.empty())
        writeWithRetry(portcode::combine(codes));

    if (i < batch.size())
    {
        // Writes are synchronous, so the barrier is already satisfied here.
        // Back-to-back flushes collapse into this one.
        while (i < batch.size() && portcode::isFlush(batch[i]))
            ++i;
        if (config_.verbose)
            std::cout << "[PORTCODE] flush, " << (batch.size() - i) << " request(s) deferred\n";
    }
    return std::vector<uint8_t>(batch.begin() + i, batch.end());
}

void TriggerDispatcher::writeWithRetry(uint8_t byte)
{
    const int attempts = config_.writeRetries + 1;
    for (int attempt = 1; attempt <= attempts; ++attempt)
    {
        try
        {
            transport_->write(byte);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stats_.bytesWritten++;
            }
            if (config_.verbose)
                std::cout << "[PORTCODE] sent " << portcode::formatCode(byte) << "\n";
            return;
        }
        catch (const TransportWriteError &e)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stats_.writeFailures++;
                if (e.queued())
                    stats_.bytesWritten++;
            }
            reportError(e, attempt);
            // Already handed to the driver; resending would double the trigger
            if (e.queued())
            {
                std::cerr << "WARN: portcode " << portcode::formatCode(byte)
                          << " queued but not drained in time on " << transportName_ << "\n";
                return;
            }
        }
        if (attempt < attempts && config_.retryDelayMs > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.retryDelayMs));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.bytesDropped++;
    }
    std::cerr << "WARN: portcode " << portcode::formatCode(byte) << " dropped after "
              << attempts << " failed write(s) on " << transportName_ << "\n";
}

void TriggerDispatcher::reportError(const TransportWriteError &err, int attempt)
{
    ErrorCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cb = onError_;
    }
    if (!cb)
    {
        if (config_.verbose)
            std::cerr << "WARN: " << err.what() << " (attempt " << attempt << ")\n";
        return;
    }
    try
    {
        cb(err, attempt);
    }
    catch (const std::exception &e)
    {
        std::cerr << "ERROR: portcode error callback threw: " << e.what() << "\n";
    }
}
