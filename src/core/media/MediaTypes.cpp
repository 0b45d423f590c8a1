#include "MediaTypes.hpp"

namespace Scribe {

QString mediaErrorToString(MediaError error) {
    switch (error) {
        case MediaError::FileNotFound:
            return "Media file not found";
        case MediaError::ProbeFailed:
            return "Could not read media container";
        case MediaError::DurationUnavailable:
            return "Media duration is unknown";
        case MediaError::TranscoderNotFound:
            return "ffmpeg executable could not be started";
        case MediaError::TranscodeFailed:
            return "Transcoding failed";
        case MediaError::OutputMissing:
            return "Transcoder produced no output";
        case MediaError::Timeout:
            return "Transcoding timed out";
        case MediaError::Cancelled:
            return "Transcoding cancelled";
    }
    return "Unknown media error";
}

} // namespace Scribe
