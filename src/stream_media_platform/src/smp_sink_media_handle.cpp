#include <stream_media_platform/smp_sink_media_handle.h>
#include "audio_output_platform/aop.h"
#include "smp_log.h"

#include <algorithm>
#include <atomic>

namespace smp {

namespace {

std::atomic<bool> g_autoplay_allowed{true};

constexpr int kPumpIntervalMs = 10;
constexpr int64_t kPumpBlockFrames = 2048;
constexpr TimeUS kTimeUpdateIntervalUS = 100000;
constexpr TimeUS kEnoughDataMarginUS = kMicrosPerSecond;

} // namespace

void SetAutoplayAllowed(bool allowed) {
    g_autoplay_allowed.store(allowed);
}

bool AutoplayAllowed() {
    return g_autoplay_allowed.load();
}

SharedOutput::~SharedOutput() = default;

std::shared_ptr<SharedOutput> OpenSharedOutput(const aop::AopConfig& config) {
    auto shared = std::make_shared<SharedOutput>();
    shared->format = AudioFormat{SampleFormat::F32, config.sample_rate, config.channels};

    aop::AopOpenReport report;
    shared->device = aop::AudioOutput::Open(config, &report);
    if (!shared->device) {
        SMP_LOG_WARN("No audio output (%s); playback runs on the wall clock",
                     report.error.c_str());
        return shared;
    }

    shared->format.sample_rate = report.actual_sample_rate;
    shared->format.channels = report.actual_channels;
    SMP_LOG_DEBUG("Audio output '%s' %dHz %dch buffer=%dms", report.device_name.c_str(),
                  report.actual_sample_rate, report.actual_channels, report.actual_buffer_ms);
    return shared;
}

SinkMediaHandle::SinkMediaHandle(std::shared_ptr<PcmSourceBuffer> source,
                                 std::shared_ptr<SharedOutput> output,
                                 QObject* parent)
    : MediaHandle(parent)
    , m_source(std::move(source))
    , m_output(std::move(output)) {
    m_scratch.resize(static_cast<size_t>(kPumpBlockFrames) *
                     static_cast<size_t>(m_source->Format().channels));

    m_pump.setInterval(kPumpIntervalMs);
    connect(&m_pump, &QTimer::timeout, this, &SinkMediaHandle::pumpTick);
    connect(m_source.get(), &SourceBuffer::updateEnded, this, &SinkMediaHandle::onSourceUpdated);
    connect(m_source.get(), &PcmSourceBuffer::endOfStreamSignalled,
            this, &SinkMediaHandle::onSourceUpdated);
}

SinkMediaHandle::~SinkMediaHandle() {
    stopOutput();
}

Result<void> SinkMediaHandle::Play() {
    if (!AutoplayAllowed()) {
        return Error::not_allowed("play() requires user activation");
    }
    if (!m_paused) {
        return Result<void>();
    }

    // Playing an ended element restarts it
    if (m_ended) {
        m_position = 0;
        m_ended = false;
    }

    m_paused = false;
    startOutput();

    if (GetReadyState() >= ReadyState::HaveFutureData) {
        post(&MediaHandle::playing);
    } else {
        m_waiting = true;
        post(&MediaHandle::waiting);
    }
    return Result<void>();
}

void SinkMediaHandle::Pause() {
    if (m_paused) return;
    m_position = CurrentTime();
    stopOutput();
    m_paused = true;
    m_waiting = false;
    post(&MediaHandle::paused);
}

TimeUS SinkMediaHandle::CurrentTime() const {
    if (m_paused) {
        return m_position;
    }
    TimeUS pos = m_start_position + playedSinceStart();
    return std::min(pos, std::max(m_start_position, m_source->EndTime()));
}

void SinkMediaHandle::SetCurrentTime(TimeUS t) {
    t = std::max<TimeUS>(0, t);
    if (m_source->Ended()) {
        t = std::min(t, m_source->EndTime());
    }

    const bool was_playing = !m_paused;
    if (was_playing) {
        stopOutput();
    }
    m_position = t;
    m_ended = false;
    if (was_playing) {
        startOutput();
    }

    m_last_time_update = t;
    post(&MediaHandle::timeUpdated);
    post(&MediaHandle::seeked);
    noteReadyState();
}

TimeUS SinkMediaHandle::Duration() const {
    return m_source->EndTime();
}

ReadyState SinkMediaHandle::GetReadyState() const {
    const TimeUS pos = CurrentTime();
    const TimeUS end = m_source->EndTime();
    const bool ended = m_source->Ended();

    if (ended && pos >= end) {
        return ReadyState::HaveEnoughData;
    }

    auto ranges = m_source->Buffered();
    if (ranges.empty()) {
        return ended ? ReadyState::HaveMetadata : ReadyState::HaveNothing;
    }

    for (const auto& range : ranges) {
        if (!range.contains(pos)) continue;
        if ((ended && range.end == end) || range.end - pos >= kEnoughDataMarginUS) {
            return ReadyState::HaveEnoughData;
        }
        return ReadyState::HaveFutureData;
    }
    return ReadyState::HaveMetadata;
}

void SinkMediaHandle::SetVolume(double volume) {
    m_volume = std::clamp(volume, 0.0, 1.0);
    if (ownsOutput()) {
        m_output->device->SetVolume(static_cast<float>(m_volume));
    }
}

void SinkMediaHandle::pumpTick() {
    if (m_paused) return;

    if (ownsOutput()) {
        int64_t writable = m_output->device->WritableFrames();
        while (writable > 0) {
            int64_t n = m_source->CopyFrames(m_write_frame, m_scratch.data(),
                                             std::min(writable, kPumpBlockFrames));
            if (n == 0) break;
            int64_t written = m_output->device->WriteF32(m_scratch.data(), n);
            m_write_frame += written;
            writable -= written;
            if (written < n) break;
        }
    }

    const TimeUS pos = CurrentTime();
    const TimeUS end = m_source->EndTime();

    if (m_source->Ended() && pos >= end) {
        finishPlayback(end);
        return;
    }

    if (pos >= end && !m_waiting) {
        m_waiting = true;
        if (clockOnly()) {
            // Freeze the wall clock at the starvation point
            m_start_position = end;
            m_clock.restart();
        }
        SMP_LOG_DEBUG("SinkMediaHandle starved at %lldus", static_cast<long long>(pos));
        post(&MediaHandle::waiting);
        noteReadyState();
    }

    if (pos - m_last_time_update >= kTimeUpdateIntervalUS || pos < m_last_time_update) {
        m_last_time_update = pos;
        post(&MediaHandle::timeUpdated);
    }
}

void SinkMediaHandle::onSourceUpdated() {
    const TimeUS duration = m_source->EndTime();
    if (duration != m_last_duration) {
        m_last_duration = duration;
        post(&MediaHandle::durationChanged);
    }

    if (m_waiting && !m_paused && GetReadyState() >= ReadyState::HaveFutureData) {
        m_waiting = false;
        if (clockOnly()) {
            m_clock.restart();  // resume from the starvation point
        }
        noteReadyState();
        post(&MediaHandle::playing);
        return;
    }
    noteReadyState();
}

void SinkMediaHandle::finishPlayback(TimeUS end) {
    stopOutput();
    m_position = end;
    m_paused = true;
    m_ended = true;
    m_waiting = false;
    m_last_time_update = end;
    SMP_LOG_DEBUG("SinkMediaHandle ended at %lldus", static_cast<long long>(end));
    post(&MediaHandle::timeUpdated);
    post(&MediaHandle::ended);
}

void SinkMediaHandle::startOutput() {
    m_start_position = m_position;
    m_write_frame = us_to_frames(m_position, m_source->Format().sample_rate);
    m_clock.start();

    if (m_output->device) {
        if (m_output->owner && m_output->owner != this) {
            SMP_LOG_DEBUG("SinkMediaHandle taking over output device");
        }
        m_output->owner = this;
        m_output->device->Stop();
        m_output->device->Flush();
        m_output->device->SetVolume(static_cast<float>(m_volume));
        m_output->device->Start();
    }

    m_pump.start();
    pumpTick();
}

void SinkMediaHandle::stopOutput() {
    m_pump.stop();
    if (ownsOutput()) {
        m_output->device->Stop();
        m_output->device->Flush();
        m_output->owner = nullptr;
    }
}

bool SinkMediaHandle::ownsOutput() const {
    return m_output->device && m_output->owner == this;
}

bool SinkMediaHandle::clockOnly() const {
    return !m_output->device;
}

TimeUS SinkMediaHandle::playedSinceStart() const {
    if (clockOnly()) {
        return m_clock.isValid() ? m_clock.nsecsElapsed() / 1000 : 0;
    }
    if (ownsOutput()) {
        return m_output->device->PlayheadTimeUS();
    }
    return 0;  // device taken over by another handle
}

void SinkMediaHandle::post(void (MediaHandle::*signal)()) {
    QMetaObject::invokeMethod(this, [this, signal]() { emit (this->*signal)(); },
                              Qt::QueuedConnection);
}

void SinkMediaHandle::noteReadyState() {
    ReadyState state = GetReadyState();
    if (state >= ReadyState::HaveFutureData && m_last_ready_state < ReadyState::HaveFutureData) {
        post(&MediaHandle::canPlay);
    } else if (state < ReadyState::HaveFutureData && m_last_ready_state >= ReadyState::HaveFutureData
               && m_paused) {
        post(&MediaHandle::suspended);
    }
    m_last_ready_state = state;
}

} // namespace smp
