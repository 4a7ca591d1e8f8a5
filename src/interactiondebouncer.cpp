#include "interactiondebouncer.hpp"

#include <utility>

InteractionDebouncer::InteractionDebouncer(const EngineTimings& timings, MonotonicClock clock, QObject *parent)
    : QObject(parent)
    , m_timings(timings)
    , m_clock(std::move(clock))
{
    m_timer.setSingleShot(true);
    connect(&m_timer, &QTimer::timeout, this, &InteractionDebouncer::onTimeout);
}

void InteractionDebouncer::notify()
{
    if (m_timer.isActive()) {
        return;
    }
    m_timer.start(m_timings.interactionDebounceMs);
}

void InteractionDebouncer::markRefreshed()
{
    m_lastRefreshAtMs = m_clock();
}

bool InteractionDebouncer::isPending() const
{
    return m_timer.isActive();
}

void InteractionDebouncer::onTimeout()
{
    if (m_lastRefreshAtMs.has_value()
        && m_clock() - m_lastRefreshAtMs.value() < m_timings.minRefreshSpacingMs) {
        m_timer.start(m_timings.interactionRescheduleMs);
        return;
    }
    emit refreshRequested();
}
