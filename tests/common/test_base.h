#pragma once

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QLoggingCategory>
#include <QTest>

#include <stream_media_platform/smp_time.h>

Q_DECLARE_LOGGING_CATEGORY(lectorTests)

/**
 * Base class for Lector tests: quiet logging and event-loop helpers.
 * Components under test post work to the event loop; tests drain it
 * explicitly so completion order stays deterministic.
 */
class TestBase : public QObject
{
    Q_OBJECT

protected:
    QElapsedTimer m_timer;

public:
    TestBase(QObject *parent = nullptr) : QObject(parent) {}

protected slots:
    virtual void initTestCase() {
        QLoggingCategory::setFilterRules("lector.*.debug=false\nlector.tests=true");
        qCInfo(lectorTests, "Initializing test case: %s", metaObject()->className());
    }

    virtual void init() {
        m_timer.start();
    }

    virtual void cleanup() {
        // Drop deleteLater()s and queued calls left by the test
        drainEvents();
        auto elapsedMs = m_timer.elapsed();
        if (elapsedMs > 1000) {
            qCWarning(lectorTests, "Slow test detected: %lldms", elapsedMs);
        }
    }

protected:
    // Run queued calls and zero-timers until nothing is left
    static void drainEvents(int rounds = 5) {
        for (int i = 0; i < rounds; ++i) {
            QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
            QCoreApplication::processEvents(QEventLoop::AllEvents);
        }
    }

    static smp::TimeUS sec(double seconds) {
        return smp::seconds_to_us(seconds);
    }
};
