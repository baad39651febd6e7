#pragma once

#include <QElapsedTimer>
#include <QObject>
#include <QTimer>

#include <functional>

namespace lector {

/**
 * Leading + trailing edge throttle.
 *
 * The first call runs immediately; calls within waitMs of the last run
 * replace one pending trailing call, fired when the window closes.
 */
class Throttle : public QObject
{
    Q_OBJECT

public:
    explicit Throttle(int waitMs, QObject* parent = nullptr);

    void call(std::function<void()> fn);
    void cancel();
    bool hasPending() const { return m_timer.isActive(); }

private:
    void fire();

    int m_waitMs;
    QElapsedTimer m_lastRun;
    QTimer m_timer;
    std::function<void()> m_pending;
};

} // namespace lector
