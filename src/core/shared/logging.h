#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(aqCore)
Q_DECLARE_LOGGING_CATEGORY(aqStore)
Q_DECLARE_LOGGING_CATEGORY(aqQuery)
Q_DECLARE_LOGGING_CATEGORY(aqTools)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
