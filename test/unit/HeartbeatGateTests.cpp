//===----------------------------------------------------------------------===//
//
// Part of the wakatime-ls project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "wakatimels/Heartbeat/HeartbeatGate.h"

namespace
{

using TimePoint = std::chrono::system_clock::time_point;

struct ManualClock final
{
    std::shared_ptr<TimePoint> now = std::make_shared<TimePoint>(std::chrono::seconds(1'700'000'000));

    wakatimels::heartbeat::WallClock source() const
    {
        return [now = now]() { return *now; };
    }

    void advance(const std::chrono::system_clock::duration step) const
    {
        *now += step;
    }
};

wakatimels::heartbeat::Event makeEvent(const std::string& uri, const bool isWrite)
{
    wakatimels::heartbeat::Event event;
    event.uri     = uri;
    event.isWrite = isWrite;
    return event;
}

}  // namespace

bool runHeartbeatGateTests()
{
    using namespace wakatimels::heartbeat;
    using std::chrono::seconds;

    {
        const ManualClock clock;
        const TimePoint   start = *clock.now;
        HeartbeatGate     gate(clock.source());
        const CurrentFile initial = gate.current();
        if (!initial.uri.empty() || initial.timestamp != start)
        {
            std::cerr << "gate should start with an empty uri stamped at construction\n";
            return false;
        }

        // First save of the session: the uri differs from "".
        const auto first = gate.admit(makeEvent("/a.rs", true));
        if (!first || *first != start)
        {
            std::cerr << "first write event should dispatch\n";
            return false;
        }

        clock.advance(seconds(1));
        if (gate.admit(makeEvent("/a.rs", true)))
        {
            std::cerr << "repeated save within the window should be dropped\n";
            return false;
        }
        if (gate.current().timestamp != start)
        {
            std::cerr << "dropped event must not touch the record\n";
            return false;
        }

        // Non-write events pass the gate inside the window.
        clock.advance(seconds(10));
        const auto change = gate.admit(makeEvent("/a.rs", false));
        if (!change || *change != start + seconds(11) || gate.current().timestamp != start + seconds(11))
        {
            std::cerr << "non-write event on the same file should dispatch and advance the record\n";
            return false;
        }

        // The window is anchored on the last dispatch, not on the dropped event.
        clock.advance(seconds(119));
        if (gate.admit(makeEvent("/a.rs", true)))
        {
            std::cerr << "save 119s after last dispatch should be dropped\n";
            return false;
        }
        clock.advance(seconds(1));
        const auto boundary = gate.admit(makeEvent("/a.rs", true));
        if (!boundary || *boundary != start + seconds(131))
        {
            std::cerr << "save exactly two minutes after last dispatch should dispatch\n";
            return false;
        }

        // A different file bypasses the window.
        clock.advance(seconds(1));
        if (!gate.admit(makeEvent("/b.rs", true)))
        {
            std::cerr << "save on another file should dispatch\n";
            return false;
        }
        clock.advance(seconds(1));
        if (!gate.admit(makeEvent("/a.rs", true)))
        {
            std::cerr << "switching back to the first file should dispatch\n";
            return false;
        }
        const CurrentFile current = gate.current();
        if (current.uri != "/a.rs" || current.timestamp != start + seconds(133))
        {
            std::cerr << "record should hold the last dispatched uri and decision time\n";
            return false;
        }
    }

    {
        const ManualClock clock;
        HeartbeatGate     gate(clock.source());
        clock.advance(seconds(30));
        const auto first = gate.admit(makeEvent("/a.rs", false));
        if (!first)
        {
            std::cerr << "open should dispatch\n";
            return false;
        }

        // Wall clock steps back by an hour.
        clock.advance(-std::chrono::hours(1));
        const auto afterStep = gate.admit(makeEvent("/b.rs", false));
        if (!afterStep || *afterStep != *first || gate.current().timestamp != *first)
        {
            std::cerr << "record timestamp must not move backwards\n";
            return false;
        }
        if (gate.admit(makeEvent("/b.rs", true)))
        {
            std::cerr << "clamped clock should keep the window closed\n";
            return false;
        }
    }

    {
        // Concurrent identical saves: exactly one passes.
        const ManualClock clock;
        HeartbeatGate     gate(clock.source());
        clock.advance(seconds(5));

        std::atomic<int>         admitted{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i)
        {
            threads.emplace_back([&gate, &admitted]() {
                if (gate.admit(makeEvent("/same.rs", true)))
                {
                    admitted.fetch_add(1);
                }
            });
        }
        for (auto& thread : threads)
        {
            thread.join();
        }
        if (admitted.load() != 1)
        {
            std::cerr << "expected exactly one concurrent save to pass, got " << admitted.load() << "\n";
            return false;
        }
    }

    {
        // The default clock is the system clock.
        const auto    before = std::chrono::system_clock::now();
        HeartbeatGate gate;
        const auto    after = std::chrono::system_clock::now();
        const auto    stamp = gate.current().timestamp;
        if (stamp < before || stamp > after)
        {
            std::cerr << "default gate clock should be the system clock\n";
            return false;
        }
    }

    return true;
}
