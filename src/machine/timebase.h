#pragma once

#include "../core/regenconstants.h"

class Clock;

// Per-channel acquisition time. A channel's timestamp is
//     now - startTime - accumulatedPause
// and freezes while the channel is paused, so samples stay monotonic
// across any number of stop/start cycles.
class TimeBase {
public:
    explicit TimeBase(const Clock* clock);

    // Records the start instant the first time only
    void start(Regen::Channel channel);
    // Both idempotent: a second pause or a resume without pause does nothing
    void pause(Regen::Channel channel);
    void resume(Regen::Channel channel);
    // Forgets start and pause bookkeeping of this channel only
    void reset(Regen::Channel channel);

    bool isStarted(Regen::Channel channel) const { return entry(channel).startTime >= 0; }
    bool isPaused(Regen::Channel channel) const { return entry(channel).pauseTime >= 0; }
    bool isRunning(Regen::Channel channel) const { return isStarted(channel) && !isPaused(channel); }

    // Channel time in seconds, -1 if never started
    double timestamp(Regen::Channel channel) const;
    double accumulatedPause(Regen::Channel channel) const { return entry(channel).accumulatedPause; }

private:
    struct Entry {
        double startTime = -1;
        double pauseTime = -1;
        double accumulatedPause = 0;
    };

    static constexpr int ChannelCount = 3;

    Entry& entry(Regen::Channel channel) { return m_entries[static_cast<int>(channel)]; }
    const Entry& entry(Regen::Channel channel) const { return m_entries[static_cast<int>(channel)]; }

    const Clock* m_clock;
    Entry m_entries[ChannelCount];
};
