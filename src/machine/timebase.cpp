#include "timebase.h"
#include "../core/clock.h"
#include <QDebug>

TimeBase::TimeBase(const Clock* clock)
    : m_clock(clock)
{
}

void TimeBase::start(Regen::Channel channel)
{
    Entry& e = entry(channel);
    if (e.startTime >= 0) return;

    e.startTime = m_clock->now();
    e.pauseTime = -1;
    e.accumulatedPause = 0;
    qDebug() << "[TimeBase]" << Regen::channelToString(channel) << "started";
}

void TimeBase::pause(Regen::Channel channel)
{
    Entry& e = entry(channel);
    if (e.startTime < 0 || e.pauseTime >= 0) return;

    e.pauseTime = m_clock->now();
    qDebug() << "[TimeBase]" << Regen::channelToString(channel) << "paused at" << timestamp(channel);
}

void TimeBase::resume(Regen::Channel channel)
{
    Entry& e = entry(channel);
    if (e.pauseTime < 0) return;

    e.accumulatedPause += m_clock->now() - e.pauseTime;
    e.pauseTime = -1;
    qDebug() << "[TimeBase]" << Regen::channelToString(channel) << "resumed, total pause"
             << e.accumulatedPause << "s";
}

void TimeBase::reset(Regen::Channel channel)
{
    entry(channel) = Entry();
}

double TimeBase::timestamp(Regen::Channel channel) const
{
    const Entry& e = entry(channel);
    if (e.startTime < 0) return -1;

    double reference = (e.pauseTime >= 0) ? e.pauseTime : m_clock->now();
    return reference - e.startTime - e.accumulatedPause;
}
