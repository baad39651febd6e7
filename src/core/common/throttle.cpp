#include "throttle.h"

namespace lector {

Throttle::Throttle(int waitMs, QObject* parent)
    : QObject(parent)
    , m_waitMs(waitMs)
{
    m_timer.setSingleShot(true);
    connect(&m_timer, &QTimer::timeout, this, &Throttle::fire);
}

void Throttle::call(std::function<void()> fn)
{
    m_timer.stop();
    m_pending = nullptr;

    if (!m_lastRun.isValid() || m_lastRun.elapsed() >= m_waitMs) {
        m_lastRun.start();
        fn();
        return;
    }

    m_pending = std::move(fn);
    m_timer.start(static_cast<int>(m_waitMs - m_lastRun.elapsed()));
}

void Throttle::cancel()
{
    m_timer.stop();
    m_pending = nullptr;
}

void Throttle::fire()
{
    if (!m_pending) {
        return;
    }
    auto fn = std::move(m_pending);
    m_pending = nullptr;
    m_lastRun.start();
    fn();
}

} // namespace lector
