#include "monotonicclock.hpp"

#include <QElapsedTimer>

namespace {
const QElapsedTimer& processTimer()
{
    static const QElapsedTimer timer = []() {
        QElapsedTimer started;
        started.start();
        return started;
    }();
    return timer;
}
}

MonotonicClock systemMonotonicClock()
{
    processTimer();
    return []() { return processTimer().elapsed(); };
}
