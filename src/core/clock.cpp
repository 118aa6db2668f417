#include "clock.h"

SystemClock::SystemClock()
{
    m_timer.start();
}

double SystemClock::now() const
{
    return m_timer.nsecsElapsed() / 1e9;
}
