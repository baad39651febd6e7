#include <stream_media_platform/smp_source_buffer.h>
#include <stream_media_platform/smp_decode_pool.h>
#include "smp_log.h"

#include <algorithm>
#include <cstring>

namespace smp {

namespace {

// Sub-range [from, to) of a segment, quota share proportional to frames kept
PcmSegment slice_segment(const PcmSegment& seg, int64_t from_frame, int64_t to_frame) {
    const PcmChunk& pcm = *seg.pcm;
    const int64_t total = pcm.frames();
    const int64_t first = from_frame - seg.start_frame;
    const int64_t count = to_frame - from_frame;
    const size_t ch = static_cast<size_t>(pcm.channels());

    std::vector<float> samples(static_cast<size_t>(count) * ch);
    std::memcpy(samples.data(), pcm.data_f32() + static_cast<size_t>(first) * ch,
                samples.size() * sizeof(float));

    PcmSegment out;
    out.start_frame = from_frame;
    out.pcm = PcmChunk::FromSamples(pcm.sample_rate(), pcm.channels(), std::move(samples));
    out.encoded_bytes = total > 0
        ? static_cast<size_t>((static_cast<double>(seg.encoded_bytes) * count) / total)
        : 0;
    return out;
}

} // namespace

PcmSourceBuffer::PcmSourceBuffer(const AudioFormat& format, size_t quota_bytes, QObject* parent)
    : SourceBuffer(parent)
    , m_format(format)
    , m_quota_bytes(quota_bytes) {
    qRegisterMetaType<smp::Error>("smp::Error");
}

PcmSourceBuffer::~PcmSourceBuffer() {
    Abort();
}

bool PcmSourceBuffer::Updating() const {
    return m_updating;
}

Result<void> PcmSourceBuffer::AppendBuffer(const QByteArray& bytes, const QString& mime_type) {
    if (m_updating) {
        return Error::invalid_state("AppendBuffer while updating");
    }
    if (m_ended) {
        return Error::invalid_state("AppendBuffer after EndOfStream");
    }

    const size_t size = static_cast<size_t>(bytes.size());
    if (m_retained_bytes + size > m_quota_bytes) {
        return Error::quota_exceeded("retained " + std::to_string(m_retained_bytes) +
                                     " + " + std::to_string(size) + " > quota " +
                                     std::to_string(m_quota_bytes));
    }

    m_updating = true;

    if (bytes.isEmpty()) {
        scheduleDeferredUpdate();
        return Result<void>();
    }

    const AudioFormat format = m_format;
    const std::string mime = mime_type.toStdString();
    QFuture<DecodeOutcome> future = DecodePool::Shared().Run<DecodeOutcome>([bytes, mime, format]() {
        DecodeOutcome outcome;
        auto result = DecodeAudioBuffer(reinterpret_cast<const uint8_t*>(bytes.constData()),
                                        static_cast<size_t>(bytes.size()), mime, format);
        if (result.is_error()) {
            outcome.error = result.error();
        } else {
            outcome.pcm = result.value();
        }
        return outcome;
    });

    m_pending_bytes = size;
    m_watcher = new QFutureWatcher<DecodeOutcome>(this);
    connect(m_watcher, &QFutureWatcherBase::finished, this, &PcmSourceBuffer::onDecodeFinished);
    m_watcher->setFuture(future);
    return Result<void>();
}

void PcmSourceBuffer::onDecodeFinished() {
    auto* watcher = m_watcher;
    m_watcher = nullptr;
    m_updating = false;

    if (!watcher) return;
    watcher->deleteLater();

    if (watcher->isCanceled() || watcher->future().resultCount() == 0) {
        emit updateFailed(Error::aborted());
        return;
    }

    DecodeOutcome outcome = watcher->result();
    if (!outcome.pcm) {
        SMP_LOG_WARN("PcmSourceBuffer append failed: %s", outcome.error.describe().c_str());
        emit updateFailed(outcome.error);
        return;
    }

    PcmSegment seg;
    seg.start_frame = m_end_frame;
    seg.pcm = outcome.pcm;
    seg.encoded_bytes = m_pending_bytes;
    m_end_frame = seg.end_frame();
    m_retained_bytes += seg.encoded_bytes;
    m_segments.push_back(std::move(seg));
    m_pending_bytes = 0;

    SMP_LOG_DEBUG("PcmSourceBuffer appended: end=%lldus retained=%zu bytes",
                  static_cast<long long>(EndTime()), m_retained_bytes);
    emit updateEnded();
}

Result<void> PcmSourceBuffer::Remove(TimeUS start, TimeUS end) {
    if (m_updating) {
        return Error::invalid_state("Remove while updating");
    }
    if (start < 0 || end <= start) {
        return Error::invalid_arg("Remove range must be non-empty");
    }

    const int64_t rm_start = us_to_frames(start, m_format.sample_rate);
    const int64_t rm_end = us_to_frames(end, m_format.sample_rate);

    std::vector<PcmSegment> kept;
    kept.reserve(m_segments.size() + 1);
    size_t retained = 0;

    for (const auto& seg : m_segments) {
        const int64_t s = seg.start_frame;
        const int64_t e = seg.end_frame();
        if (e <= rm_start || s >= rm_end) {
            kept.push_back(seg);
        } else {
            if (s < rm_start) {
                kept.push_back(slice_segment(seg, s, rm_start));
            }
            if (e > rm_end) {
                kept.push_back(slice_segment(seg, rm_end, e));
            }
        }
    }
    for (const auto& seg : kept) {
        retained += seg.encoded_bytes;
    }

    SMP_LOG_DEBUG("PcmSourceBuffer remove [%lld,%lld)us: %zu -> %zu bytes",
                  static_cast<long long>(start), static_cast<long long>(end),
                  m_retained_bytes, retained);

    m_segments = std::move(kept);
    m_retained_bytes = retained;

    m_updating = true;
    scheduleDeferredUpdate();
    return Result<void>();
}

void PcmSourceBuffer::scheduleDeferredUpdate() {
    const uint64_t seq = ++m_deferred_seq;
    m_deferred_pending = true;
    QMetaObject::invokeMethod(this, [this, seq]() { completeDeferredUpdate(seq); },
                              Qt::QueuedConnection);
}

void PcmSourceBuffer::completeDeferredUpdate(uint64_t seq) {
    if (!m_deferred_pending || seq != m_deferred_seq) return;  // aborted
    m_deferred_pending = false;
    m_updating = false;
    emit updateEnded();
}

std::vector<TimeSpan> PcmSourceBuffer::Buffered() const {
    std::vector<TimeSpan> ranges;
    for (const auto& seg : m_segments) {
        TimeUS s = frames_to_us(seg.start_frame, m_format.sample_rate);
        TimeUS e = frames_to_us(seg.end_frame(), m_format.sample_rate);
        if (!ranges.empty() && ranges.back().end == s) {
            ranges.back().end = e;
        } else if (e > s) {
            ranges.push_back(TimeSpan{s, e});
        }
    }
    return ranges;
}

void PcmSourceBuffer::Abort() {
    if (m_watcher) {
        m_watcher->disconnect(this);
        m_watcher->deleteLater();
        m_watcher = nullptr;
    }
    m_deferred_pending = false;
    m_pending_bytes = 0;
    m_updating = false;
}

void PcmSourceBuffer::EndOfStream() {
    if (m_ended) return;
    m_ended = true;
    SMP_LOG_DEBUG("PcmSourceBuffer end of stream at %lldus", static_cast<long long>(EndTime()));
    emit endOfStreamSignalled();
}

bool PcmSourceBuffer::Ended() const {
    return m_ended;
}

TimeUS PcmSourceBuffer::EndTime() const {
    return frames_to_us(m_end_frame, m_format.sample_rate);
}

int64_t PcmSourceBuffer::CopyFrames(int64_t frame_pos, float* dst, int64_t max_frames) const {
    auto it = std::upper_bound(m_segments.begin(), m_segments.end(), frame_pos,
        [](int64_t pos, const PcmSegment& seg) { return pos < seg.start_frame; });
    if (it == m_segments.begin()) return 0;
    --it;

    const size_t ch = static_cast<size_t>(m_format.channels);
    int64_t copied = 0;
    int64_t pos = frame_pos;
    while (copied < max_frames && it != m_segments.end() && pos >= it->start_frame &&
           pos < it->end_frame()) {
        int64_t n = std::min(max_frames - copied, it->end_frame() - pos);
        const float* src = it->pcm->data_f32() + static_cast<size_t>(pos - it->start_frame) * ch;
        std::memcpy(dst + static_cast<size_t>(copied) * ch, src,
                    static_cast<size_t>(n) * ch * sizeof(float));
        copied += n;
        pos += n;
        ++it;
    }
    return copied;
}

} // namespace smp
