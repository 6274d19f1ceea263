#include "core/rules/rules_document.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonParseError>

namespace aq {

namespace {

QString answerText(const QJsonValue& value)
{
    if (value.isString()) {
        return value.toString().trimmed();
    }
    if (value.isObject()) {
        const QJsonObject obj = value.toObject();
        if (obj.contains(QStringLiteral("answer_html"))) {
            return obj.value(QStringLiteral("answer_html")).toString().trimmed();
        }
        return obj.value(QStringLiteral("answer")).toString().trimmed();
    }
    return {};
}

QString firstString(const QJsonObject& obj, const char* primary, const char* fallback)
{
    const QString value = obj.value(QLatin1String(primary)).toString();
    if (!value.isEmpty()) {
        return value;
    }
    return obj.value(QLatin1String(fallback)).toString();
}

} // namespace

QString RuleQuestion::answerFor(const QString& countryCode) const
{
    return answersByCountry.value(countryCode.trimmed().toUpper());
}

std::optional<RulesDocument> RulesDocument::loadFromFile(const QString& path)
{
    QFile file(path);
    if (!file.exists()) {
        LOG_WARN(aqStore, "Rules file not found: %s", qUtf8Printable(path));
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_ERROR(aqStore, "Failed to open rules file: %s", qUtf8Printable(path));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError) {
        LOG_ERROR(aqStore, "Failed to parse rules JSON (%s): %s",
                  qUtf8Printable(path), qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    std::optional<RulesDocument> rules = fromJson(doc);
    if (rules.has_value()) {
        LOG_INFO(aqStore, "Loaded %d rule questions from %s",
                 static_cast<int>(rules->questions().size()), qUtf8Printable(path));
    }
    return rules;
}

std::optional<RulesDocument> RulesDocument::fromJson(const QJsonDocument& doc)
{
    QJsonArray questionArray;
    if (doc.isArray()) {
        questionArray = doc.array();
    } else if (doc.isObject() && doc.object().value(QStringLiteral("questions")).isArray()) {
        questionArray = doc.object().value(QStringLiteral("questions")).toArray();
    } else {
        LOG_ERROR(aqStore, "Rules JSON has no questions array");
        return std::nullopt;
    }

    std::vector<RuleQuestion> questions;
    questions.reserve(static_cast<size_t>(questionArray.size()));
    for (const QJsonValue& entry : questionArray) {
        if (!entry.isObject()) {
            continue;
        }
        const QJsonObject obj = entry.toObject();

        RuleQuestion question;
        question.id = firstString(obj, "question_id", "id");
        question.text = firstString(obj, "question_text", "question");
        question.category = obj.value(QStringLiteral("category")).toString();
        if (question.category.isEmpty()) {
            question.category = QStringLiteral("General");
        }
        if (question.text.isEmpty()) {
            question.text = QStringLiteral("Unknown Rule");
        }

        const QJsonObject answers = obj.value(QStringLiteral("answers_by_country")).toObject();
        for (auto it = answers.constBegin(); it != answers.constEnd(); ++it) {
            question.answersByCountry.insert(it.key().trimmed().toUpper(), answerText(it.value()));
        }
        questions.push_back(std::move(question));
    }

    return RulesDocument(std::move(questions));
}

} // namespace aq
