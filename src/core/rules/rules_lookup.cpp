#include "core/rules/rules_lookup.h"

#include <QSet>

namespace aq {

namespace {

bool categoryMatches(const RuleQuestion& question, const QString& category)
{
    const QString wanted = category.trimmed();
    return wanted.isEmpty() || question.category.compare(wanted, Qt::CaseInsensitive) == 0;
}

} // namespace

std::vector<RuleAnswer> RulesLookup::byCountry(const QString& countryCode,
                                               const QString& category) const
{
    std::vector<RuleAnswer> answers;
    for (const RuleQuestion& question : m_document.questions()) {
        if (!categoryMatches(question, category)) {
            continue;
        }
        const QString answer = question.answerFor(countryCode);
        if (answer.isEmpty()) {
            continue;
        }
        answers.push_back(RuleAnswer{question.text, question.category, answer});
    }
    return answers;
}

std::vector<RuleComparison> RulesLookup::compare(const QString& countryA,
                                                 const QString& countryB,
                                                 const QString& category) const
{
    std::vector<RuleComparison> rows;
    for (const RuleQuestion& question : m_document.questions()) {
        if (!categoryMatches(question, category)) {
            continue;
        }
        QString a = question.answerFor(countryA);
        QString b = question.answerFor(countryB);
        if (a.isEmpty()) a = kNotAvailable;
        if (b.isEmpty()) b = kNotAvailable;

        if (a == kNotAvailable && b == kNotAvailable) {
            continue;
        }
        rows.push_back(RuleComparison{question.text, question.category, a, b});
    }
    return rows;
}

QStringList RulesLookup::countries() const
{
    QSet<QString> seen;
    for (const RuleQuestion& question : m_document.questions()) {
        for (auto it = question.answersByCountry.constBegin();
             it != question.answersByCountry.constEnd(); ++it) {
            if (!it.value().isEmpty()) {
                seen.insert(it.key());
            }
        }
    }
    QStringList codes(seen.begin(), seen.end());
    codes.sort();
    return codes;
}

QStringList RulesLookup::categories() const
{
    QStringList result;
    for (const RuleQuestion& question : m_document.questions()) {
        if (!result.contains(question.category)) {
            result.append(question.category);
        }
    }
    return result;
}

} // namespace aq
