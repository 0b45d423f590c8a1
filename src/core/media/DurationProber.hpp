#pragma once

#include <QtCore/QString>

#include "core/common/Expected.hpp"
#include "MediaTypes.hpp"

namespace Scribe {

class DurationProber {
public:
    virtual ~DurationProber() = default;

    // Total media duration in seconds.
    virtual Expected<double, MediaError> probe(const QString& mediaPath) = 0;
};

/**
 * @brief Reads the container duration with libavformat.
 *
 * Only the header and stream info are read; nothing is decoded.
 */
class FFmpegDurationProber : public DurationProber {
public:
    FFmpegDurationProber() = default;

    Expected<double, MediaError> probe(const QString& mediaPath) override;

private:
    static QString avErrorString(int averror);
};

} // namespace Scribe
