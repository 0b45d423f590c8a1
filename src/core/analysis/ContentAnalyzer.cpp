#include "ContentAnalyzer.hpp"
#include "core/common/Logger.hpp"
#include "core/transcription/ResultAggregator.hpp"

#include <QtCore/QJsonArray>

namespace Scribe {

namespace {

QJsonArray findingsToJson(const std::vector<SegmentFinding>& findings) {
    QJsonArray array;
    for (const auto& finding : findings) {
        QJsonObject json;
        json["timestamp"] = finding.timestamp;
        json["text"] = finding.text;
        json["start"] = finding.start;
        array.append(json);
    }
    return array;
}

} // namespace

QJsonObject AnalysisResult::toJson() const {
    QJsonArray matches;
    for (const auto& match : keywordMatches) {
        QJsonObject json;
        json["keyword"] = match.keyword;
        json["matches"] = QJsonArray::fromStringList(match.matches);
        json["count"] = match.count;
        matches.append(json);
    }

    QJsonObject frequency;
    for (const auto& [keyword, count] : keywordFrequency) {
        frequency[keyword] = count;
    }

    QJsonObject json;
    json["keyword_matches"] = matches;
    json["keyword_frequency"] = frequency;
    json["questions"] = findingsToJson(questions);
    json["emphasis_cues"] = findingsToJson(emphasisCues);
    json["total_words"] = totalWords;
    return json;
}

ContentAnalyzer::ContentAnalyzer(Config::AnalysisSettings settings)
    : settings_(std::move(settings)) {
    patternsValid_ = compile(settings_.questionPatterns, questionPatterns_) &&
                     compile(settings_.emphasisPatterns, emphasisPatterns_);
}

bool ContentAnalyzer::compile(const QStringList& patterns, std::vector<QRegularExpression>& compiled) {
    compiled.clear();
    for (const QString& pattern : patterns) {
        QRegularExpression regex(pattern, QRegularExpression::CaseInsensitiveOption);
        if (!regex.isValid()) {
            SCRIBE_ERROR("Invalid analysis pattern '{}': {}", pattern.toStdString(),
                         regex.errorString().toStdString());
            return false;
        }
        regex.optimize();
        compiled.push_back(std::move(regex));
    }
    return true;
}

Expected<AnalysisResult, AnalysisError> ContentAnalyzer::analyze(const QString& transcript,
                                                                 const std::vector<Segment>& segments,
                                                                 const QStringList& keywords) const {
    if (!patternsValid_) {
        return makeUnexpected(AnalysisError::InvalidPattern);
    }

    AnalysisResult result;

    for (const QString& keyword : keywords) {
        if (keyword.trimmed().isEmpty()) {
            continue;
        }
        KeywordMatch match = matchKeyword(transcript, keyword);
        if (match.count > 0) {
            result.keywordMatches.push_back(std::move(match));
        }

        const int frequency = countWholePhrase(transcript, keyword);
        if (frequency > 0) {
            result.keywordFrequency[keyword] = frequency;
        }
    }

    for (const Segment& segment : segments) {
        const QString text = segment.text.trimmed();
        if (text.isEmpty()) {
            continue;
        }
        if (const auto* pattern = firstMatch(questionPatterns_, text)) {
            result.questions.push_back({formatTimestamp(segment.start), text, segment.start,
                                        pattern->pattern()});
        }
        if (const auto* pattern = firstMatch(emphasisPatterns_, text)) {
            result.emphasisCues.push_back({formatTimestamp(segment.start), text, segment.start,
                                           pattern->pattern()});
        }
    }

    result.totalWords = ResultAggregator::countWords(transcript);
    return result;
}

KeywordMatch ContentAnalyzer::matchKeyword(const QString& transcript, const QString& keyword) const {
    const QString window = QString(".{0,%1}").arg(settings_.contextWindowChars);
    const QRegularExpression regex(window + QRegularExpression::escape(keyword) + window,
                                   QRegularExpression::CaseInsensitiveOption);

    KeywordMatch match;
    match.keyword = keyword;
    auto it = regex.globalMatch(transcript);
    while (it.hasNext()) {
        const auto found = it.next();
        ++match.count;
        if (match.matches.size() < settings_.maxMatchesPerKeyword) {
            match.matches << found.captured(0).trimmed();
        }
    }
    return match;
}

int ContentAnalyzer::countWholePhrase(const QString& transcript, const QString& keyword) {
    // Lookarounds instead of \b so keywords ending in symbols ("c++") still match.
    const QRegularExpression regex("(?<!\\w)" + QRegularExpression::escape(keyword.trimmed()) + "(?!\\w)",
                                   QRegularExpression::CaseInsensitiveOption |
                                   QRegularExpression::UseUnicodePropertiesOption);
    int count = 0;
    auto it = regex.globalMatch(transcript);
    while (it.hasNext()) {
        it.next();
        ++count;
    }
    return count;
}

const QRegularExpression* ContentAnalyzer::firstMatch(const std::vector<QRegularExpression>& patterns,
                                                      const QString& text) {
    for (const auto& pattern : patterns) {
        if (pattern.match(text).hasMatch()) {
            return &pattern;
        }
    }
    return nullptr;
}

} // namespace Scribe
