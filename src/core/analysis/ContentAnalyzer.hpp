#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QRegularExpression>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <map>
#include <vector>

#include "core/common/Config.hpp"
#include "core/common/Expected.hpp"
#include "core/transcription/TranscriptionTypes.hpp"

namespace Scribe {

enum class AnalysisError {
    InvalidPattern
};

struct KeywordMatch {
    QString keyword;
    QStringList matches;    // excerpts, at most maxMatchesPerKeyword
    int count = 0;          // every occurrence, including excerpts not kept
};

struct SegmentFinding {
    QString timestamp;
    QString text;
    double start = 0.0;
    QString pattern;        // the pattern that matched first
};

struct AnalysisResult {
    std::vector<KeywordMatch> keywordMatches;
    std::map<QString, int> keywordFrequency;
    std::vector<SegmentFinding> questions;
    std::vector<SegmentFinding> emphasisCues;
    int totalWords = 0;

    QJsonObject toJson() const;
};

/**
 * @brief Pattern based keyword, question and emphasis detection.
 *
 * analyze() reads nothing but its arguments and the immutable settings, so
 * identical input always yields identical output.
 */
class ContentAnalyzer {
public:
    explicit ContentAnalyzer(Config::AnalysisSettings settings = Config::AnalysisSettings());

    Expected<AnalysisResult, AnalysisError> analyze(const QString& transcript,
                                                    const std::vector<Segment>& segments,
                                                    const QStringList& keywords) const;

private:
    KeywordMatch matchKeyword(const QString& transcript, const QString& keyword) const;
    static int countWholePhrase(const QString& transcript, const QString& keyword);
    static bool compile(const QStringList& patterns, std::vector<QRegularExpression>& compiled);
    static const QRegularExpression* firstMatch(const std::vector<QRegularExpression>& patterns,
                                                const QString& text);

    Config::AnalysisSettings settings_;
    std::vector<QRegularExpression> questionPatterns_;
    std::vector<QRegularExpression> emphasisPatterns_;
    bool patternsValid_ = true;
};

} // namespace Scribe
