#pragma once

#include "smp_audio.h"
#include "smp_media_handle.h"
#include "smp_source_buffer.h"

#include <QElapsedTimer>
#include <QTimer>

#include <memory>
#include <vector>

namespace aop {
class AudioOutput;
struct AopConfig;
}

namespace smp {

// One output device shared by every handle of a session; at most one
// handle owns it at a time. Without a device, handles run clock-only.
struct SharedOutput {
    std::unique_ptr<aop::AudioOutput> device;
    AudioFormat format = default_audio_format();
    const void* owner = nullptr;

    ~SharedOutput();
};

// Open the default device. Never fails: a missing device yields a
// clock-only SharedOutput in the requested format.
std::shared_ptr<SharedOutput> OpenSharedOutput(const aop::AopConfig& config);

// MediaHandle playing a PcmSourceBuffer through a SharedOutput.
// Position is the device playhead (frames actually consumed) offset by the
// position playback started from; notifications are posted asynchronously.
class SinkMediaHandle : public MediaHandle {
    Q_OBJECT

public:
    SinkMediaHandle(std::shared_ptr<PcmSourceBuffer> source,
                    std::shared_ptr<SharedOutput> output,
                    QObject* parent = nullptr);
    ~SinkMediaHandle() override;

    Result<void> Play() override;
    void Pause() override;
    bool Paused() const override { return m_paused; }

    TimeUS CurrentTime() const override;
    void SetCurrentTime(TimeUS t) override;
    TimeUS Duration() const override;

    ReadyState GetReadyState() const override;

    double Volume() const override { return m_volume; }
    void SetVolume(double volume) override;

    const std::shared_ptr<PcmSourceBuffer>& Source() const { return m_source; }

private:
    void pumpTick();
    void onSourceUpdated();
    void finishPlayback(TimeUS end);

    void startOutput();
    void stopOutput();
    bool ownsOutput() const;
    bool clockOnly() const;
    TimeUS playedSinceStart() const;

    void post(void (MediaHandle::*signal)());
    void noteReadyState();

    std::shared_ptr<PcmSourceBuffer> m_source;
    std::shared_ptr<SharedOutput> m_output;

    bool m_paused = true;
    bool m_ended = false;
    bool m_waiting = false;
    double m_volume = 1.0;

    TimeUS m_position = 0;        // authoritative while paused
    TimeUS m_start_position = 0;  // position output started from
    int64_t m_write_frame = 0;    // next source frame to hand to the device
    TimeUS m_last_time_update = 0;
    TimeUS m_last_duration = 0;
    ReadyState m_last_ready_state = ReadyState::HaveNothing;

    QTimer m_pump;
    QElapsedTimer m_clock;        // clock-only playback
    std::vector<float> m_scratch;
};

} // namespace smp
