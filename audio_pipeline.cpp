/*
 * audio_pipeline.cpp
 *
 * PCM16 handling for one session, in both directions.
 *
 * Key capabilities
 * ─────────────────
 * • Inbound client frames are checked (non-empty, whole samples, bounded
 *   size) before they reach the provider; bad frames are logged and dropped.
 * • Provider audio is queued in a capped buffer and drained in fixed frames,
 *   padded with silence on underflow.
 * • Playback is paced against a playhead kept a short lead ahead of real
 *   time, so the browser is never flooded.
 * • Barge-in clears the queue and arms a drain that refuses the rest of the
 *   interrupted response until the next one starts.
 * • Buffer pool reduces heap pressure while streaming.
 */

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

#include "audio_pipeline.h"

/* ═══════════════════════════════════════════════════════════════════════════
 * BufferPool
 * ═══════════════════════════════════════════════════════════════════════════ */

/* Acquire a vector, preferring a recycled one from the pool. */
std::vector<uint8_t> BufferPool::acquire() {
    std::lock_guard<std::mutex> lk(m_mu);
    if (!m_pool.empty()) {
        auto v = std::move(m_pool.back());
        m_pool.pop_back();
        v.clear();
        return v;
    }
    return {};
}

/* Return a used vector back to the pool (cleared internally). */
void BufferPool::release(std::vector<uint8_t> &&v) {
    std::lock_guard<std::mutex> lk(m_mu);
    if (m_pool.size() < MAX_POOL && v.capacity() > 0) {
        v.clear();
        m_pool.push_back(std::move(v));
    }
}

size_t BufferPool::size() {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_pool.size();
}


/* ═══════════════════════════════════════════════════════════════════════════
 * AudioBuffer
 * ═══════════════════════════════════════════════════════════════════════════ */

AudioBuffer::AudioBuffer(size_t maxSamples)
    : m_maxSamples(maxSamples),
      m_drainArmed(false),
      m_overflowed(0)
{
}

size_t AudioBuffer::append(const uint8_t *data, size_t len) {
    if (!data) return 0;
    const size_t samples = len / RELAY_BYTES_PER_SAMPLE;
    if (samples == 0) return 0;

    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_drainArmed) return 0;

    for (size_t i = 0; i < samples; ++i) {
        const uint16_t lo = data[2 * i];
        const uint16_t hi = data[2 * i + 1];
        m_samples.push_back(static_cast<int16_t>(lo | (hi << 8)));
    }
    if (m_samples.size() > m_maxSamples) {
        const size_t excess = m_samples.size() - m_maxSamples;
        m_samples.erase(m_samples.begin(), m_samples.begin() + excess);
        m_overflowed += excess;
    }
    return samples;
}

size_t AudioBuffer::drain(size_t samples, std::vector<uint8_t> &out) {
    out.resize(samples * RELAY_BYTES_PER_SAMPLE);

    std::lock_guard<std::mutex> lk(m_mutex);
    const size_t real = std::min(samples, m_samples.size());
    for (size_t i = 0; i < real; ++i) {
        const uint16_t s = static_cast<uint16_t>(m_samples.front());
        m_samples.pop_front();
        out[2 * i]     = static_cast<uint8_t>(s & 0xff);
        out[2 * i + 1] = static_cast<uint8_t>(s >> 8);
    }
    /* underflow: pad with silence rather than block */
    std::fill(out.begin() + real * RELAY_BYTES_PER_SAMPLE, out.end(), 0);
    return real;
}

size_t AudioBuffer::clear(bool armDrain) {
    std::lock_guard<std::mutex> lk(m_mutex);
    const size_t cleared = m_samples.size();
    m_samples.clear();
    if (armDrain) m_drainArmed = true;
    return cleared;
}

void AudioBuffer::resetDrain() {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_drainArmed = false;
}

bool AudioBuffer::isDrainArmed() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_drainArmed;
}

size_t AudioBuffer::size() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_samples.size();
}

size_t AudioBuffer::overflowed() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_overflowed;
}


/* ═══════════════════════════════════════════════════════════════════════════
 * AudioPipeline
 * ═══════════════════════════════════════════════════════════════════════════ */

AudioPipeline::AudioPipeline(const std::string &sessionId,
                             const LogConfig &log,
                             std::chrono::milliseconds playbackLead)
    : m_sessionId(sessionId),
      m_log(log),
      m_playbackLead(playbackLead)
{
}

bool AudioPipeline::validateFrame(size_t len, std::string &reason) {
    if (len == 0) {
        reason = "empty frame";
        return false;
    }
    if (len % RELAY_BYTES_PER_SAMPLE != 0) {
        reason = "odd byte count " + std::to_string(len) + " is not 16-bit PCM";
        return false;
    }
    if (len > MAX_INBOUND_FRAME_BYTES) {
        reason = "frame of " + std::to_string(len) + " bytes exceeds " +
                 std::to_string(MAX_INBOUND_FRAME_BYTES);
        return false;
    }
    return true;
}

bool AudioPipeline::forwardInbound(const uint8_t *data, size_t len,
                                   const Forwarder &forward)
{
    std::string reason;
    if (!data || !validateFrame(len, reason)) {
        if (reason.empty()) reason = "null frame";
        ++m_framesRejected;
        spdlog::warn("({}) AudioFormatError: dropping client frame: {}",
            m_sessionId, reason);
        return false;
    }

    auto buf = m_pool.acquire();
    buf.assign(data, data + len);
    Envelope env = Envelope::audio(std::move(buf));

    if (m_log.shouldLogEvent(LOG_FRONTEND_AUDIO)) {
        spdlog::debug("({}) client audio frame, {} bytes", m_sessionId, len);
    }

    forward(env);
    ++m_framesForwarded;
    m_pool.release(env.releasePcm());
    return true;
}

size_t AudioPipeline::enqueuePlayback(const Envelope &audio) {
    if (!audio.isAudio()) return 0;
    const auto &pcm = audio.pcm();
    if (pcm.size() % RELAY_BYTES_PER_SAMPLE != 0) {
        spdlog::warn("({}) AudioFormatError: provider audio has odd length {} - "
            "trailing byte dropped", m_sessionId, pcm.size());
    }
    const size_t queued = m_buffer.append(pcm.data(), pcm.size());
    if (queued == 0 && !pcm.empty() && m_buffer.isDrainArmed()) {
        spdlog::debug("({}) discarding {} bytes of interrupted response audio",
            m_sessionId, pcm.size());
    }
    return queued;
}

std::vector<uint8_t> AudioPipeline::drainFrame(size_t samples, size_t *realSamples) {
    auto frame = m_pool.acquire();
    const size_t real = m_buffer.drain(samples, frame);
    if (realSamples) *realSamples = real;
    return frame;
}

size_t AudioPipeline::pumpPlayback(Clock::time_point now, const FrameSink &sink) {
    static const Clock::duration kFrame = std::chrono::milliseconds(PLAYBACK_FRAME_MS);

    if (m_resetPlayhead.exchange(false) || m_playhead < now)
        m_playhead = now;

    size_t frames = 0;
    while (m_playhead - now < m_playbackLead && m_buffer.size() > 0) {
        sink(drainFrame(PLAYBACK_FRAME_SAMPLES));
        m_playhead += kFrame;
        ++frames;
    }
    return frames;
}

void AudioPipeline::recycle(std::vector<uint8_t> &&frame) {
    m_pool.release(std::move(frame));
}

size_t AudioPipeline::bargeIn() {
    const size_t cleared = m_buffer.clear(true);
    /* the client drops its own queue on speech_started */
    m_resetPlayhead.store(true);
    spdlog::info("({}) barge-in: cleared {} queued samples", m_sessionId, cleared);
    return cleared;
}

void AudioPipeline::resetDrain() {
    m_buffer.resetDrain();
}

size_t AudioPipeline::release() {
    const size_t cleared = m_buffer.clear(true);
    m_resetPlayhead.store(true);
    return cleared;
}
