#pragma once

#include <QHash>
#include <QJsonDocument>
#include <QString>
#include <optional>
#include <vector>

namespace aq {

struct RuleQuestion {
    QString id;
    QString text;
    QString category;
    QHash<QString, QString> answersByCountry;  // ISO-2 (upper case) -> answer

    // Answer for the country, empty when none is recorded.
    QString answerFor(const QString& countryCode) const;
};

// RulesDocument -- static question/answers-by-country table read from
// rules.json. Immutable once loaded.
class RulesDocument {
public:
    RulesDocument() = default;
    explicit RulesDocument(std::vector<RuleQuestion> questions)
        : m_questions(std::move(questions)) {}

    // Returns nullopt if the file is missing or is not valid rules JSON.
    static std::optional<RulesDocument> loadFromFile(const QString& path);

    // Accepts a top-level questions array or an object with "questions".
    static std::optional<RulesDocument> fromJson(const QJsonDocument& doc);

    const std::vector<RuleQuestion>& questions() const { return m_questions; }
    bool isEmpty() const { return m_questions.empty(); }

private:
    std::vector<RuleQuestion> m_questions;
};

} // namespace aq
