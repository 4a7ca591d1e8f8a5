#include "commanddispatcher.hpp"

namespace {
// Independent CLI calls run side by side.
constexpr int kMaxWorkers = 16;
}

CommandDispatcher::CommandDispatcher(QObject *parent)
    : QObject(parent)
{
    m_pool.setMaxThreadCount(kMaxWorkers);
}

CommandDispatcher::~CommandDispatcher()
{
    m_pool.waitForDone();
}

int CommandDispatcher::inFlight() const
{
    return m_inFlight;
}

bool CommandDispatcher::waitForDone(int timeoutMs)
{
    return m_pool.waitForDone(timeoutMs);
}

void CommandDispatcher::beginTask()
{
    ++m_inFlight;
    emit inFlightChanged();
}

void CommandDispatcher::endTask()
{
    if (m_inFlight > 0) {
        --m_inFlight;
    }
    emit inFlightChanged();
}
