#include "core/shared/json_value.h"

#include <cmath>
#include <limits>

namespace aq {

std::optional<QString> jsonString(const QJsonValue& value)
{
    if (!value.isString()) {
        return std::nullopt;
    }
    const QString str = value.toString().trimmed();
    if (str.isEmpty()) {
        return std::nullopt;
    }
    return str;
}

std::optional<int> jsonInt(const QJsonValue& value)
{
    if (value.isDouble()) {
        const double d = value.toDouble();
        if (!std::isfinite(d) || std::floor(d) != d
            || d < std::numeric_limits<int>::min() || d > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(d);
    }
    if (value.isString()) {
        bool ok = false;
        const int parsed = value.toString().trimmed().toInt(&ok);
        if (ok) {
            return parsed;
        }
    }
    return std::nullopt;
}

std::optional<double> jsonDouble(const QJsonValue& value)
{
    if (value.isDouble()) {
        const double d = value.toDouble();
        if (!std::isfinite(d)) {
            return std::nullopt;
        }
        return d;
    }
    if (value.isString()) {
        bool ok = false;
        const double parsed = value.toString().trimmed().toDouble(&ok);
        if (ok && std::isfinite(parsed)) {
            return parsed;
        }
    }
    return std::nullopt;
}

std::optional<bool> jsonBool(const QJsonValue& value)
{
    if (value.isBool()) {
        return value.toBool();
    }
    if (value.isString()) {
        const QString lower = value.toString().trimmed().toLower();
        if (lower == QLatin1String("true")) return true;
        if (lower == QLatin1String("false")) return false;
    }
    return std::nullopt;
}

} // namespace aq
