#pragma once

#include <QJsonValue>
#include <QString>
#include <optional>

namespace aq {

// Lenient readers for model-produced JSON. Each returns nullopt when the
// value is absent, null, or cannot be coerced.

// Strings; numbers are not stringified. Blank strings count as absent.
std::optional<QString> jsonString(const QJsonValue& value);

// Integral doubles and numeric strings ("12", " 12 ").
std::optional<int> jsonInt(const QJsonValue& value);

// Doubles and numeric strings.
std::optional<double> jsonDouble(const QJsonValue& value);

// true/false and the strings "true"/"false" (case-insensitive).
std::optional<bool> jsonBool(const QJsonValue& value);

} // namespace aq
