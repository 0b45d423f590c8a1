#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include <optional>

#include "core/common/CancellationToken.hpp"
#include "core/common/Expected.hpp"
#include "MediaTypes.hpp"

namespace Scribe {

class Transcoder {
public:
    virtual ~Transcoder() = default;

    /**
     * @brief Writes [start, start + duration) of input to output.
     * @param duration Length in seconds; nullopt copies to the end of input
     * @param limit Deadline and cancellation for this call
     */
    virtual Expected<void, MediaError> extract(const QString& inputPath,
                                               double start,
                                               std::optional<double> duration,
                                               const QString& outputPath,
                                               const EncodingOptions& options,
                                               const WorkLimit& limit) = 0;
};

// Runs the ffmpeg executable through QProcess.
class FFmpegTranscoder : public Transcoder {
public:
    explicit FFmpegTranscoder(QString ffmpegProgram = QStringLiteral("ffmpeg"));

    Expected<void, MediaError> extract(const QString& inputPath,
                                       double start,
                                       std::optional<double> duration,
                                       const QString& outputPath,
                                       const EncodingOptions& options,
                                       const WorkLimit& limit) override;

    static QStringList buildArguments(const QString& inputPath,
                                      double start,
                                      std::optional<double> duration,
                                      const QString& outputPath,
                                      const EncodingOptions& options);

private:
    QString program_;
};

} // namespace Scribe
