#pragma once

#include "core/rules/rules_document.h"

#include <QStringList>

namespace aq {

struct RuleAnswer {
    QString question;
    QString category;
    QString answer;
};

struct RuleComparison {
    QString question;
    QString category;
    QString answerA;  // "N/A" when the country has no answer
    QString answerB;
};

// RulesLookup -- keyed and side-by-side queries over a RulesDocument.
// Country codes and category names match case-insensitively; an empty
// category means every category.
class RulesLookup {
public:
    explicit RulesLookup(const RulesDocument& document) : m_document(document) {}

    static inline const QString kNotAvailable = QStringLiteral("N/A");

    // Every question with a non-empty answer for the country, in document order.
    std::vector<RuleAnswer> byCountry(const QString& countryCode,
                                      const QString& category = {}) const;

    // Questions where at least one of the two countries has an answer.
    std::vector<RuleComparison> compare(const QString& countryA,
                                        const QString& countryB,
                                        const QString& category = {}) const;

    // Sorted ISO-2 codes with at least one non-empty answer.
    QStringList countries() const;

    // Distinct categories in first-seen order.
    QStringList categories() const;

private:
    const RulesDocument& m_document;
};

} // namespace aq
