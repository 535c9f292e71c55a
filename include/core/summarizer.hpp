#pragma once

#include "core/transcript_types.hpp"
#include <string>
#include <vector>

namespace meetscribe {
namespace core {

struct MeetingSummary {
    std::string notes;
    std::vector<std::string> action_items;
};

/**
 * Turns a closed session's transcript into notes and action items. Called
 * once per session, after the final transcript is archived.
 */
class Summarizer {
public:
    virtual ~Summarizer() = default;

    virtual MeetingSummary summarize(const std::string& session_id,
                                     const std::vector<TranscriptEntry>& transcript) = 0;
};

} // namespace core
} // namespace meetscribe
