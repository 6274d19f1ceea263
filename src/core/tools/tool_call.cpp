#include "core/tools/tool_call.h"
#include "core/shared/json_value.h"
#include "core/shared/logging.h"

#include <QJsonDocument>
#include <QJsonParseError>

namespace aq {

namespace {

// Index of the first '{' that is followed (after optional whitespace) by
// the "name" key, or -1.
int findToolCallStart(const QString& text)
{
    static const QString kNameKey = QStringLiteral("\"name\"");
    int from = 0;
    while (true) {
        const int brace = text.indexOf(QLatin1Char('{'), from);
        if (brace < 0) {
            return -1;
        }
        int cursor = brace + 1;
        while (cursor < text.size() && text.at(cursor).isSpace()) {
            ++cursor;
        }
        if (text.mid(cursor, kNameKey.size()) == kNameKey) {
            return brace;
        }
        from = brace + 1;
    }
}

// Index of the brace closing the object opened at `start`, or -1.
int findMatchingBrace(const QString& text, int start)
{
    int depth = 0;
    bool inString = false;
    bool escaped = false;
    for (int i = start; i < text.size(); ++i) {
        const QChar ch = text.at(i);
        if (inString) {
            if (escaped) {
                escaped = false;
            } else if (ch == QLatin1Char('\\')) {
                escaped = true;
            } else if (ch == QLatin1Char('"')) {
                inString = false;
            }
            continue;
        }
        if (ch == QLatin1Char('"')) {
            inString = true;
        } else if (ch == QLatin1Char('{')) {
            ++depth;
        } else if (ch == QLatin1Char('}')) {
            --depth;
            if (depth == 0) {
                return i;
            }
        }
    }
    return -1;
}

} // namespace

QString toolErrorCodeToString(ToolErrorCode code)
{
    switch (code) {
    case ToolErrorCode::NotInitialized:        return QStringLiteral("NOT_INITIALIZED");
    case ToolErrorCode::MissingArgument:       return QStringLiteral("MISSING_ARGUMENT");
    case ToolErrorCode::LocationNotFound:      return QStringLiteral("LOCATION_NOT_FOUND");
    case ToolErrorCode::AirportNotFound:       return QStringLiteral("AIRPORT_NOT_FOUND");
    case ToolErrorCode::UnknownTool:           return QStringLiteral("UNKNOWN_TOOL");
    case ToolErrorCode::DataSourceUnavailable: return QStringLiteral("DATA_SOURCE_UNAVAILABLE");
    case ToolErrorCode::MalformedToolCall:     return QStringLiteral("MALFORMED_TOOL_CALL");
    case ToolErrorCode::NoResults:             return QStringLiteral("NO_RESULTS");
    case ToolErrorCode::ExecutionFailed:       return QStringLiteral("EXECUTION_FAILED");
    }
    return QStringLiteral("UNKNOWN");
}

// ── ToolArguments ───────────────────────────────────────────

std::optional<QString> ToolArguments::string(std::initializer_list<const char*> keys) const
{
    for (const char* key : keys) {
        if (std::optional<QString> value = jsonString(m_arguments.value(QLatin1String(key)))) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<int> ToolArguments::integer(std::initializer_list<const char*> keys) const
{
    for (const char* key : keys) {
        if (std::optional<int> value = jsonInt(m_arguments.value(QLatin1String(key)))) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<double> ToolArguments::number(std::initializer_list<const char*> keys) const
{
    for (const char* key : keys) {
        if (std::optional<double> value = jsonDouble(m_arguments.value(QLatin1String(key)))) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<bool> ToolArguments::boolean(std::initializer_list<const char*> keys) const
{
    for (const char* key : keys) {
        if (std::optional<bool> value = jsonBool(m_arguments.value(QLatin1String(key)))) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<QJsonObject> ToolArguments::object(const char* key) const
{
    const QJsonValue value = m_arguments.value(QLatin1String(key));
    if (!value.isObject()) {
        return std::nullopt;
    }
    return value.toObject();
}

bool ToolArguments::contains(const char* key) const
{
    return m_arguments.contains(QLatin1String(key));
}

// ── ToolResult ──────────────────────────────────────────────

ToolResult ToolResult::success(const QString& text)
{
    ToolResult result;
    result.m_text = text;
    return result;
}

ToolResult ToolResult::error(ToolErrorCode code, const QString& message)
{
    ToolResult result;
    result.m_errorCode = code;
    result.m_errorMessage = message;
    return result;
}

ToolResult ToolResult::notInitialized()
{
    return error(ToolErrorCode::NotInitialized, QStringLiteral("Tool dispatcher not initialized"));
}

ToolResult ToolResult::missingArgument(const QString& name)
{
    return error(ToolErrorCode::MissingArgument, QStringLiteral("Missing '%1' argument").arg(name));
}

ToolResult ToolResult::locationNotFound(const QString& query)
{
    return error(ToolErrorCode::LocationNotFound, QStringLiteral("Could not find location: %1").arg(query));
}

ToolResult ToolResult::airportNotFound(const QString& icao)
{
    return error(ToolErrorCode::AirportNotFound, QStringLiteral("Airport not found: %1").arg(icao));
}

ToolResult ToolResult::unknownTool(const QString& name)
{
    return error(ToolErrorCode::UnknownTool, QStringLiteral("Unknown tool: %1").arg(name));
}

ToolResult ToolResult::dataSourceUnavailable(const QString& source)
{
    return error(ToolErrorCode::DataSourceUnavailable, QStringLiteral("%1 not available").arg(source));
}

ToolResult ToolResult::malformedToolCall()
{
    return error(ToolErrorCode::MalformedToolCall, QStringLiteral("No valid tool call found"));
}

ToolResult ToolResult::executionFailed(const QString& cause)
{
    return error(ToolErrorCode::ExecutionFailed, QStringLiteral("Tool execution failed: %1").arg(cause));
}

QString ToolResult::value() const
{
    if (isError()) {
        return QStringLiteral("Error: ") + m_errorMessage;
    }
    return m_text;
}

// ── parseToolCall ───────────────────────────────────────────

std::optional<ToolCallRequest> parseToolCall(const QString& text)
{
    const int start = findToolCallStart(text);
    if (start < 0) {
        return std::nullopt;
    }
    const int end = findMatchingBrace(text, start);
    if (end < 0) {
        LOG_DEBUG(aqTools, "parseToolCall: unbalanced braces");
        return std::nullopt;
    }

    const QString candidate = text.mid(start, end - start + 1);
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(candidate.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_DEBUG(aqTools, "parseToolCall: invalid JSON: %s",
                  qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    const QJsonObject obj = doc.object();
    const QJsonValue name = obj.value(QStringLiteral("name"));
    const QJsonValue arguments = obj.value(QStringLiteral("arguments"));
    if (!name.isString() || name.toString().trimmed().isEmpty() || !arguments.isObject()) {
        return std::nullopt;
    }

    return ToolCallRequest{name.toString().trimmed(), arguments.toObject()};
}

} // namespace aq
