#include <opencv2/core.hpp>
#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "config_loader.hpp"
#include "portcode_protocol.hpp"
#include "trigger_dispatcher.hpp"

static void sleepMs(int ms)
{
    if (ms <= 0)
        return;
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

// Enqueue one code and report how long the caller was held up.
static double timedSend(TriggerDispatcher &dispatcher, int code)
{
    uint64_t start = (uint64_t)cv::getTickCount();
    dispatcher.sendPortcode(code);
    uint64_t end = (uint64_t)cv::getTickCount();
    double elapsedUs = (end - start) * 1e6 / cv::getTickFrequency();
    std::cout << "   · send " << portcode::formatCode(static_cast<uint8_t>(code))
              << " returned after " << elapsedUs << " us\n";
    return elapsedUs;
}

int main(int argc, char *argv[])
{
    std::cout << "========================================\n";
    std::cout << "PORTCODE SELF-TEST (trigger dispatcher)\n";
    std::cout << "========================================\n\n";

    std::string cfgPathUsed;
    auto cfg = loadConfig({"../config/portcode_config.yaml", "config/portcode_config.yaml"}, &cfgPathUsed);
    if (cfgPathUsed.empty())
        std::cout << "WARN: no portcode_config.yaml found, using defaults\n";
    else
        std::cout << "✓ Config: " << cfgPathUsed << "\n";

    DispatcherConfig dcfg = dispatcherConfigFrom(cfg);
    // Port override from argv, if present
    if (argc > 1)
        dcfg.port = argv[1];

    std::unique_ptr<TriggerDispatcher> dispatcher;
    try
    {
        dispatcher = std::make_unique<TriggerDispatcher>(dcfg);
    }
    catch (const ConstructionError &e)
    {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    dispatcher->setErrorCallback([](const TransportWriteError &err, int attempt)
                                 { std::cerr << "WARN: write attempt " << attempt << " failed: " << err.what() << "\n"; });
    std::cout << "✓ Transport: " << dispatcher->transportName() << "\n";

    // Same sequence as the original bench check: single lines, a pair sent
    // back to back (may be merged), all lines, then a last single line.
    struct Step
    {
        std::vector<int> codes;
        int pauseMs;
    };
    const std::vector<Step> steps = {
        {{1}, 500},
        {{4, 8}, 500},
        {{1}, 500},
        {{255}, 500},
        {{2}, 0},
    };

    double worstUs = 0.0;
    for (const auto &step : steps)
    {
        for (int code : step.codes)
            worstUs = std::max(worstUs, timedSend(*dispatcher, code));
        sleepMs(step.pauseMs);
    }

    if (!dispatcher->waitUntilSent(std::max(1000, dcfg.writeTimeoutMs * (dcfg.writeRetries + 1) * 2)))
        std::cerr << "WARN: dispatcher still busy, closing anyway\n";
    dispatcher->close();

    DispatcherStats st = dispatcher->stats();
    std::cout << "\nCodes submitted : " << st.codesSubmitted << "\n";
    std::cout << "Bytes written   : " << st.bytesWritten << "\n";
    std::cout << "Write failures  : " << st.writeFailures << "\n";
    std::cout << "Bytes dropped   : " << st.bytesDropped << "\n";
    std::cout << "Worst enqueue   : " << worstUs << " us\n";
    return st.bytesDropped == 0 ? 0 : 2;
}
