// SPDX-License-Identifier: MIT

// example/ticker/main.cpp
//
// Samples a counter every interval, keeps the even readings and shares them
// between two consumers: a running sum and a printer that is slower to ask
// for more.
//
// Usage: flowtap_ticker [ticks] [interval_ms]
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <memory>

#include <fmt/format.h>

#include "lib/stream/event_loop.hpp"
#include "lib/stream/sink.hpp"
#include "src/materializer.hpp"
#include "src/sinks.hpp"
#include "src/source.hpp"

using namespace flowtap;

int main(int argc, char** argv) {
    int ticks = argc > 1 ? std::atoi(argv[1]) : 20;
    int interval_ms = argc > 2 ? std::atoi(argv[2]) : 50;
    if (ticks <= 0 || interval_ms <= 0) {
        std::fprintf(stderr, "usage: %s [ticks] [interval_ms]\n", argv[0]);
        return 2;
    }

    EventLoop loop;
    auto mat = Materializer::Create(loop);
    if (!mat) {
        std::fprintf(stderr, "materializer: %s\n", mat.error().message.c_str());
        return 1;
    }

    int counter = 0;
    auto readings = Source<int>::FromTick(std::chrono::milliseconds(0),
                                          std::chrono::milliseconds(interval_ms),
                                          [&counter] { return ++counter; }, "clock")
                        .Filter("even", [](const int& x) { return x % 2 == 0; });

    auto shared = readings.ToFanoutPublisher(2, 8, *mat);
    if (!shared) {
        std::fprintf(stderr, "fan-out: %s\n", shared.error().message.c_str());
        return 1;
    }

    auto source = Source<int>::FromPublisher(*shared, "readings");
    int64_t total = 0;
    auto sum = source.Connect(Sink<int>::Foreach([&total](int x) { total += x; }, "sum"))
                   .Run(*mat);

    bool done = false;
    auto printer = std::make_shared<CallbackSubscriber<int>>(
        [](int x) { fmt::print("reading {}\n", x); },
        [&done](const Error& e) {
            fmt::print("printer stopped: {}\n", e.message);
            done = true;
        },
        [&done] { done = true; },
        1);
    if (auto r = (*shared)->Subscribe(printer); !r) {
        std::fprintf(stderr, "subscribe: %s\n", r.error().message.c_str());
        return 1;
    }

    // The printer asks for one reading per loop turn.
    auto deadline = std::chrono::milliseconds(static_cast<int64_t>(ticks) * interval_ms);
    auto start = std::chrono::steady_clock::now();
    while (!done && std::chrono::steady_clock::now() - start < deadline) {
        loop.Poll(interval_ms);
        printer->Request(1);
    }

    printer->Cancel();
    sum.Cancel();
    loop.PollUntil([&] { return sum.IsDone(); });

    fmt::print("pipeline: {}\n", readings.Graph().ToString());
    fmt::print("ticks sampled: {}, sum of even readings: {}\n", counter, total);
    return 0;
}
