#pragma once

#include "audio/audio_frame.hpp"
#include <string>

namespace meetscribe {
namespace audio {

/**
 * Where and as whom to join
 */
struct MeetingInfo {
    std::string meetingUrl;
    std::string platform = "google-meet";
    std::string botDisplayName = "MeetScribe";
};

/**
 * Events a connector delivers while attached to a meeting. Called from the
 * connector's own thread(s); implementations must not block for long.
 */
class ConnectorListener {
public:
    virtual ~ConnectorListener() = default;

    virtual void onAudioFrame(const RawAudioChunk& chunk) = 0;

    /**
     * Frame source lost; the connector is trying to reconnect
     */
    virtual void onDisconnected(const std::string& reason) = 0;
    virtual void onReconnected() = 0;

    /**
     * Meeting ended normally
     */
    virtual void onStreamEnded() = 0;

    /**
     * Meeting ended abnormally or the connection cannot be restored
     */
    virtual void onFatalError(const std::string& message) = 0;
};

/**
 * Meeting-platform connector. Joins a meeting and streams its mixed audio
 * to a listener until leave() or the end of the meeting.
 */
class MeetingConnector {
public:
    virtual ~MeetingConnector() = default;

    /**
     * Join and begin streaming. Throws FatalConnectorException when the
     * platform rejects the connection.
     */
    virtual void join(const MeetingInfo& meeting, ConnectorListener& listener) = 0;

    /**
     * Stop streaming and leave. No listener calls are made after it returns.
     */
    virtual void leave() = 0;

    virtual std::string getPlatformName() const = 0;
};

} // namespace audio
} // namespace meetscribe
