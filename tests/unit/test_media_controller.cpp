// Tests for MediaController: preferred state enforced against native drift

#include <QtTest>
#include <QSignalSpy>

#include "../common/test_base.h"
#include "../common/fake_media.h"

#include "core/playback/media_controller.h"

using namespace lector;

class TestMediaController : public TestBase {
    Q_OBJECT

private slots:
    void initTestCase() override {
        TestBase::initTestCase();
        qRegisterMetaType<lector::PlaybackState>();
    }

    // ── Explicit intent ──

    void test_initial_state_is_pause() {
        FakeMediaHandle handle(sec(5));
        MediaController controller(&handle);
        QCOMPARE(controller.state(), PlaybackState::Pause);
        QVERIFY(!controller.isBuffering());
    }

    void test_play_starts_handle_and_emits() {
        FakeMediaHandle handle(sec(5));
        MediaController controller(&handle);
        QSignalSpy states(&controller, &MediaController::stateChanged);

        controller.play();

        QVERIFY(!handle.Paused());
        QCOMPARE(states.count(), 1);
        QCOMPARE(states.at(0).at(0).value<PlaybackState>(), PlaybackState::Play);
    }

    void test_pause_stops_handle() {
        FakeMediaHandle handle(sec(5));
        MediaController controller(&handle);
        controller.play();
        controller.pause();
        QVERIFY(handle.Paused());
        QCOMPARE(controller.state(), PlaybackState::Pause);
    }

    void test_set_state_same_value_is_silent() {
        FakeMediaHandle handle(sec(5));
        MediaController controller(&handle);
        QSignalSpy states(&controller, &MediaController::stateChanged);
        controller.setState(PlaybackState::Pause);
        QCOMPARE(states.count(), 0);
        QCOMPARE(handle.playCalls, 0);
    }

    void test_set_state_reconciles_immediately() {
        FakeMediaHandle handle(sec(5));
        MediaController controller(&handle);
        controller.setState(PlaybackState::Play);
        QVERIFY(!handle.Paused());
        controller.setState(PlaybackState::Ended);
        QVERIFY(handle.Paused());
    }

    // ── Native drift ──

    void test_native_pause_while_playing_is_undone() {
        FakeMediaHandle handle(sec(5));
        MediaController controller(&handle);
        controller.play();
        int before = handle.playCalls;

        handle.driftPause();

        QCOMPARE(handle.playCalls, before + 1);
        QVERIFY(!handle.Paused());
        QCOMPARE(controller.state(), PlaybackState::Play);
    }

    void test_native_play_while_paused_is_undone() {
        FakeMediaHandle handle(sec(5));
        MediaController controller(&handle);

        handle.driftPlay();

        QVERIFY(handle.Paused());
        QCOMPARE(controller.state(), PlaybackState::Pause);
    }

    void test_stall_while_playing_reattempts() {
        FakeMediaHandle handle(sec(5));
        MediaController controller(&handle);
        controller.play();
        QSignalSpy buffering(&controller, &MediaController::bufferingStateChanged);

        // The primitive stops itself while starving
        handle.driftPause();
        handle.setReady(smp::ReadyState::HaveCurrentData);
        QCOMPARE(buffering.count(), 1);
        QCOMPARE(buffering.at(0).at(0).toBool(), true);
        QVERIFY(controller.isBuffering());

        handle.setReady(smp::ReadyState::HaveEnoughData);
        QCOMPARE(buffering.count(), 2);
        QVERIFY(!controller.isBuffering());
        QVERIFY(!handle.Paused());
    }

    void test_buffering_emitted_only_on_change() {
        FakeMediaHandle handle(sec(5));
        MediaController controller(&handle);
        QSignalSpy buffering(&controller, &MediaController::bufferingStateChanged);
        handle.setReady(smp::ReadyState::HaveEnoughData);
        handle.setReady(smp::ReadyState::HaveFutureData);
        QCOMPARE(buffering.count(), 0);
    }

    // ── End and failures ──

    void test_natural_end_sets_ended() {
        FakeMediaHandle handle(sec(5));
        MediaController controller(&handle);
        controller.play();
        QSignalSpy states(&controller, &MediaController::stateChanged);

        handle.finish();

        QCOMPARE(controller.state(), PlaybackState::Ended);
        QCOMPARE(states.count(), 1);
        QCOMPARE(states.at(0).at(0).value<PlaybackState>(), PlaybackState::Ended);
    }

    void test_policy_denial_reverts_to_pause() {
        FakeMediaHandle handle(sec(5));
        handle.denyPlay = true;
        MediaController controller(&handle);
        QSignalSpy states(&controller, &MediaController::stateChanged);

        controller.play();

        QCOMPARE(controller.state(), PlaybackState::Pause);
        QCOMPARE(states.count(), 2);
        QCOMPARE(states.at(1).at(0).value<PlaybackState>(), PlaybackState::Pause);
    }

    void test_other_play_failure_keeps_preference() {
        FakeMediaHandle handle(sec(5));
        handle.failPlay = true;
        MediaController controller(&handle);

        controller.play();

        QCOMPARE(controller.state(), PlaybackState::Play);
        QVERIFY(handle.Paused());
    }

    void test_time_and_volume_pass_through() {
        FakeMediaHandle handle(sec(5));
        MediaController controller(&handle);
        QSignalSpy times(&controller, &MediaController::timeUpdated);

        controller.setCurrentTime(sec(1.5));
        handle.advance(sec(0.5));
        controller.setVolume(0.25);

        QCOMPARE(controller.currentTime(), sec(2.0));
        QCOMPARE(times.count(), 1);
        QCOMPARE(times.at(0).at(0).toLongLong(), static_cast<qint64>(sec(2.0)));
        QCOMPARE(handle.Volume(), 0.25);
        QCOMPARE(controller.duration(), sec(5));
    }

    void test_destroyed_controller_stops_listening() {
        FakeMediaHandle handle(sec(5));
        {
            MediaController controller(&handle);
        }
        handle.driftPlay();
        QVERIFY(!handle.Paused());
    }
};

QTEST_MAIN(TestMediaController)
#include "test_media_controller.moc"
