#ifndef REALTIME_RELAY_H
#define REALTIME_RELAY_H

#include <cstddef>
#include <cstdint>

#define RELAY_SERVER_NAME "realtime-relay"
#define MAX_SESSION_ID (64)
#define MAX_ITEM_ID (32)     /* provider limit on client-chosen item ids */

/* ── Audio format ───────────────────────────────────────────────────────── */
/* 16-bit signed little-endian PCM, mono, fixed rate on both legs */
#define RELAY_SAMPLE_RATE       24000
#define RELAY_CHANNELS          1
#define RELAY_BYTES_PER_SAMPLE  2

/* One playback frame = 20 ms = 480 samples = 960 bytes */
#define PLAYBACK_FRAME_MS       20
#define PLAYBACK_FRAME_SAMPLES  (RELAY_SAMPLE_RATE / 1000 * PLAYBACK_FRAME_MS)

/* Largest accepted client frame: 1 s of audio */
#define MAX_INBOUND_FRAME_BYTES (RELAY_SAMPLE_RATE * RELAY_BYTES_PER_SAMPLE)

/* Outbound AudioBuffer cap: 60 s of audio, oldest dropped past this */
#define MAX_PLAYBACK_SAMPLES    (RELAY_SAMPLE_RATE * 60)

/* Frontend frames above this are rejected by the socket layer */
#define MAX_FRONTEND_MESSAGE    (1024 * 1024)

/* client frames held while the provider handshake is in flight */
#define MAX_DEFERRED_FRAMES     512

/* ── Control actions ────────────────────────────────────────────────────── */
#define ACTION_CONNECTED         "connected"
#define ACTION_DISCONNECTED      "disconnected"
#define ACTION_DISCONNECT        "disconnect"
#define ACTION_CLEAR             "clear"
#define ACTION_SPEECH_STARTED    "speech_started"
#define ACTION_SPEECH_STOPPED    "speech_stopped"
#define ACTION_PROCESSING_SPEECH "processing_speech"
#define ACTION_AUDIO_CLEARED     "audio_cleared"
#define ACTION_RESPONSE_STARTED  "response_started"
#define ACTION_RESPONSE_COMPLETE "response_complete"
#define ACTION_COMMIT            "commit"
#define ACTION_CANCEL_RESPONSE   "cancel_response"

/* Session lifecycle; CLOSED is terminal */
enum SessionState {
    SESSION_CREATED,
    SESSION_CONNECTING,
    SESSION_ACTIVE,
    SESSION_CLOSING,
    SESSION_CLOSED
};

const char *sessionStateName(SessionState state);

/* Transport-level events delivered by either socket to its owner */
enum notifyEvent_t {
    CONNECT_SUCCESS,
    CONNECT_ERROR,
    CONNECTION_DROPPED,
    MESSAGE,       /* text frame */
    BINARY_AUDIO   /* raw binary audio frame */
};

#endif /* REALTIME_RELAY_H */
