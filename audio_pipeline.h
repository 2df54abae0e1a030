#ifndef AUDIO_PIPELINE_H
#define AUDIO_PIPELINE_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "envelope.h"
#include "realtime_relay.h"
#include "relay_config.h"

/*
 * A simple free-list of byte vectors.  Frames are taken from the pool and
 * handed back after each send so steady streaming does not allocate.
 */
class BufferPool {
public:
    std::vector<uint8_t> acquire();
    void release(std::vector<uint8_t> &&v);
    size_t size();

private:
    static constexpr size_t MAX_POOL = 32;
    std::vector<std::vector<uint8_t>> m_pool;
    std::mutex m_mu;
};

/*
 * Pending output samples for one session.  append, drain and clear share
 * one mutex, so a clear can never interleave with an append into a
 * partial frame.  After clear(true) the buffer stays armed and refuses new
 * audio until resetDrain().
 */
class AudioBuffer {
public:
    explicit AudioBuffer(size_t maxSamples = MAX_PLAYBACK_SAMPLES);

    /* Append LE int16 bytes; a trailing odd byte is dropped.  Returns the
     * number of samples queued (0 while drain is armed). */
    size_t append(const uint8_t *data, size_t len);

    /* Remove exactly `samples` samples into `out` (LE int16 bytes),
     * substituting silence on underflow.  Returns the real sample count. */
    size_t drain(size_t samples, std::vector<uint8_t> &out);

    /* Drop everything queued; returns the number of samples dropped. */
    size_t clear(bool armDrain);
    void   resetDrain();
    bool   isDrainArmed() const;

    size_t size() const;
    size_t overflowed() const;   /* samples dropped for exceeding the cap */

private:
    size_t              m_maxSamples;
    mutable std::mutex  m_mutex;
    std::deque<int16_t> m_samples;
    bool                m_drainArmed;
    size_t              m_overflowed;
};

class AudioPipeline {
public:
    typedef std::function<void(const Envelope &)>         Forwarder;
    typedef std::function<void(std::vector<uint8_t> &&)>  FrameSink;
    typedef std::chrono::steady_clock                     Clock;

    AudioPipeline(const std::string &sessionId,
                  const LogConfig &log,
                  std::chrono::milliseconds playbackLead);

    /* ── Inbound: client mic → provider ──────────────────────────────────── */
    /*
     * Validate one client frame and forward it immediately as a single
     * audio envelope.  Invalid frames (AudioFormatError) are dropped and
     * logged; returns false in that case.
     */
    bool forwardInbound(const uint8_t *data, size_t len, const Forwarder &forward);
    static bool validateFrame(size_t len, std::string &reason);

    /* ── Outbound: provider → client playback ────────────────────────────── */
    size_t enqueuePlayback(const Envelope &audio);

    /* One frame of exactly `samples` samples, silence-padded. */
    std::vector<uint8_t> drainFrame(size_t samples, size_t *realSamples = nullptr);

    /*
     * Send whole 20 ms frames while the client's estimated lead is below
     * the configured playback lead.  Returns the number of frames sent.
     */
    size_t pumpPlayback(Clock::time_point now, const FrameSink &sink);

    /* Return a frame handed out by drainFrame/pumpPlayback to the pool. */
    void recycle(std::vector<uint8_t> &&frame);

    /* Barge-in: clear queued audio and discard the interrupted response. */
    size_t bargeIn();
    void   resetDrain();
    bool   isDrainArmed() const { return m_buffer.isDrainArmed(); }

    /* Teardown: drop everything; returns samples released. */
    size_t release();

    size_t pendingSamples() const { return m_buffer.size(); }
    uint64_t framesForwarded() const { return m_framesForwarded.load(); }
    uint64_t framesRejected() const  { return m_framesRejected.load(); }

private:
    std::string                m_sessionId;
    const LogConfig           &m_log;
    Clock::duration            m_playbackLead;

    AudioBuffer                m_buffer;
    BufferPool                 m_pool;

    /* pacing state, touched only by the playback thread */
    Clock::time_point          m_playhead;
    std::atomic<bool>          m_resetPlayhead{false};

    std::atomic<uint64_t>      m_framesForwarded{0};
    std::atomic<uint64_t>      m_framesRejected{0};
};

#endif /* AUDIO_PIPELINE_H */
