// Tests for ChunkBufferAppender: serialized mutations, retention, quota retry

#include <QtTest>
#include <QSignalSpy>

#include "../common/test_base.h"
#include "../common/fake_media.h"

#include "core/playback/chunk_buffer_appender.h"

using namespace lector;

class TestChunkBufferAppender : public TestBase {
    Q_OBJECT

private:
    std::shared_ptr<FakeSourceBuffer> m_buffer;
    smp::TimeUS m_cursor = 0;

    std::unique_ptr<ChunkBufferAppender> makeAppender() {
        return std::make_unique<ChunkBufferAppender>(m_buffer, [this]() { return m_cursor; });
    }

private slots:
    void initTestCase() override {
        TestBase::initTestCase();
        qRegisterMetaType<smp::Error>();
    }

    void init() override {
        TestBase::init();
        m_buffer = std::make_shared<FakeSourceBuffer>();
        m_cursor = 0;
    }

    // ── Serialization ──

    void test_single_append_completes() {
        auto appender = makeAppender();
        QSignalSpy appended(appender.get(), &ChunkBufferAppender::appended);

        QVERIFY(appender->append("audio/mpeg", QByteArray(10, 'a')).is_ok());
        QVERIFY(appender->isBusy());
        m_buffer->complete();

        QCOMPARE(appended.count(), 1);
        QCOMPARE(appended.at(0).at(0).toLongLong(), static_cast<qint64>(sec(1)));
        QCOMPARE(appender->duration(), sec(1));
        QVERIFY(!appender->isBusy());
    }

    void test_appends_queue_fifo_one_at_a_time() {
        auto appender = makeAppender();
        appender->append("audio/mpeg", QByteArray(1, 'a'));
        appender->append("audio/mpeg", QByteArray(2, 'b'));
        appender->append("audio/mpeg", QByteArray(3, 'c'));

        QCOMPARE(m_buffer->log, QStringList({"append:1"}));
        QCOMPARE(appender->pendingOperations(), 2);

        m_buffer->complete();
        m_buffer->complete();
        m_buffer->complete();

        QCOMPARE(m_buffer->log, QStringList({"append:1", "append:2", "append:3"}));
        QCOMPARE(m_buffer->overlapViolations, 0);
        QCOMPARE(appender->duration(), sec(3));
    }

    // ── End ──

    void test_end_waits_for_queued_work() {
        auto appender = makeAppender();
        QSignalSpy finalized(appender.get(), &ChunkBufferAppender::finalized);
        appender->append("audio/mpeg", QByteArray(1, 'a'));
        appender->end();

        QVERIFY(!m_buffer->Ended());
        QCOMPARE(finalized.count(), 0);

        m_buffer->complete();
        QVERIFY(m_buffer->Ended());
        QVERIFY(appender->isFinalized());
        QCOMPARE(finalized.count(), 1);
    }

    void test_end_is_idempotent_and_blocks_appends() {
        auto appender = makeAppender();
        appender->end();
        appender->end();
        QCOMPARE(m_buffer->log, QStringList({"eos"}));

        auto result = appender->append("audio/mpeg", QByteArray(1, 'a'));
        QVERIFY(result.is_error());
        QCOMPARE(result.error().code, smp::ErrorCode::InvalidState);
    }

    // ── Retention ──

    void test_history_beyond_window_evicted_before_append() {
        m_buffer->setRange(0, sec(50));
        m_cursor = sec(45);
        auto appender = makeAppender();

        appender->append("audio/mpeg", QByteArray(4, 'a'));

        QCOMPARE(m_buffer->log, QStringList({QString("remove:0-%1").arg(sec(15))}));
        m_buffer->complete();
        QCOMPARE(m_buffer->log.last(), QString("append:4"));
        m_buffer->complete();
        QCOMPARE(m_buffer->Buffered().front().start, sec(15));
    }

    void test_history_within_window_kept() {
        m_buffer->setRange(0, sec(20));
        m_cursor = sec(20);
        auto appender = makeAppender();
        appender->append("audio/mpeg", QByteArray(4, 'a'));
        QCOMPARE(m_buffer->log, QStringList({"append:4"}));
    }

    // ── Quota ──

    void test_quota_rejection_evicts_then_retries_once() {
        m_buffer->setRange(0, sec(25));
        m_cursor = sec(25);
        m_buffer->rejectQuota = 1;
        auto appender = makeAppender();
        QSignalSpy errors(appender.get(), &ChunkBufferAppender::errorOccurred);
        QSignalSpy appended(appender.get(), &ChunkBufferAppender::appended);

        appender->append("audio/mpeg", QByteArray(8, 'a'));

        // Eviction precedes the retried append
        QCOMPARE(m_buffer->log, QStringList({"reject:8", QString("remove:0-%1").arg(sec(10))}));
        m_buffer->complete();
        QCOMPARE(m_buffer->log.last(), QString("append:8"));
        m_buffer->complete();

        QCOMPARE(appended.count(), 1);
        QCOMPARE(errors.count(), 0);
    }

    void test_second_quota_rejection_reports_error() {
        m_buffer->setRange(0, sec(25));
        m_cursor = sec(25);
        m_buffer->rejectQuota = 2;
        auto appender = makeAppender();
        QSignalSpy errors(appender.get(), &ChunkBufferAppender::errorOccurred);

        appender->append("audio/mpeg", QByteArray(8, 'a'));
        m_buffer->complete();

        QCOMPARE(errors.count(), 1);
        QCOMPARE(errors.at(0).at(0).value<smp::Error>().code, smp::ErrorCode::QuotaExceeded);
        QVERIFY(!appender->isBusy());
    }

    void test_failed_update_reported_and_queue_continues() {
        auto appender = makeAppender();
        QSignalSpy errors(appender.get(), &ChunkBufferAppender::errorOccurred);
        appender->append("audio/mpeg", QByteArray(1, 'a'));
        appender->append("audio/mpeg", QByteArray(2, 'b'));

        m_buffer->failUpdate(smp::Error::decode_failed("garbage"));

        QCOMPARE(errors.count(), 1);
        QCOMPARE(m_buffer->log.last(), QString("append:2"));
    }

    // ── Dispose ──

    void test_dispose_aborts_in_flight_and_drops_queue() {
        auto appender = makeAppender();
        QSignalSpy appended(appender.get(), &ChunkBufferAppender::appended);
        appender->append("audio/mpeg", QByteArray(1, 'a'));
        appender->append("audio/mpeg", QByteArray(2, 'b'));

        appender->dispose();

        QCOMPARE(m_buffer->log, QStringList({"append:1", "abort"}));
        QCOMPARE(appender->pendingOperations(), 0);
        QVERIFY(appender->append("audio/mpeg", QByteArray(1, 'c')).is_error());

        m_buffer->complete();
        QCOMPARE(appended.count(), 0);
    }
};

QTEST_MAIN(TestChunkBufferAppender)
#include "test_chunk_buffer_appender.moc"
