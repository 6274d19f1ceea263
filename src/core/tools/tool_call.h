#pragma once

#include <QJsonObject>
#include <QString>
#include <initializer_list>
#include <optional>

namespace aq {

enum class ToolErrorCode : int {
    NotInitialized        = 1,
    MissingArgument       = 2,
    LocationNotFound      = 3,
    AirportNotFound       = 4,
    UnknownTool           = 5,
    DataSourceUnavailable = 6,
    MalformedToolCall     = 7,
    NoResults             = 8,
    ExecutionFailed       = 9,
};

QString toolErrorCodeToString(ToolErrorCode code);

struct ToolCallRequest {
    QString name;
    QJsonObject arguments;
};

// ToolArguments -- typed, alias-aware view over a loosely typed argument
// object. Each accessor tries the keys in order and returns the first
// value that coerces to the requested type.
class ToolArguments {
public:
    explicit ToolArguments(QJsonObject arguments) : m_arguments(std::move(arguments)) {}

    std::optional<QString> string(std::initializer_list<const char*> keys) const;
    std::optional<int> integer(std::initializer_list<const char*> keys) const;
    std::optional<double> number(std::initializer_list<const char*> keys) const;
    std::optional<bool> boolean(std::initializer_list<const char*> keys) const;
    std::optional<QJsonObject> object(const char* key) const;

    bool contains(const char* key) const;
    const QJsonObject& raw() const { return m_arguments; }

private:
    QJsonObject m_arguments;
};

// ToolResult -- Success(text) or Error(code, message).
class ToolResult {
public:
    static ToolResult success(const QString& text);
    static ToolResult error(ToolErrorCode code, const QString& message);

    // Canonical errors
    static ToolResult notInitialized();
    static ToolResult missingArgument(const QString& name);
    static ToolResult locationNotFound(const QString& query);
    static ToolResult airportNotFound(const QString& icao);
    static ToolResult unknownTool(const QString& name);
    static ToolResult dataSourceUnavailable(const QString& source);
    static ToolResult malformedToolCall();
    static ToolResult executionFailed(const QString& cause);

    bool isSuccess() const { return !m_errorCode.has_value(); }
    bool isError() const { return m_errorCode.has_value(); }

    // Success text; empty for errors.
    const QString& text() const { return m_text; }
    std::optional<ToolErrorCode> errorCode() const { return m_errorCode; }
    const QString& errorMessage() const { return m_errorMessage; }

    // The text for callers without structured errors: the success text,
    // or "Error: <message>".
    QString value() const;

private:
    ToolResult() = default;

    QString m_text;
    std::optional<ToolErrorCode> m_errorCode;
    QString m_errorMessage;
};

// Extract the first {"name": ..., "arguments": {...}} object embedded in
// free text. Braces inside JSON strings are ignored while balancing.
// Returns nullopt on any failure; never throws.
std::optional<ToolCallRequest> parseToolCall(const QString& text);

} // namespace aq
