#include "tool_runner.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCoreApplication>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QTextStream>

#include <cstdio>

namespace aq {

namespace {

const QString kDataDirOption = QStringLiteral("data-dir");
const QString kSettingsOption = QStringLiteral("settings");
const QString kToolOption = QStringLiteral("tool");
const QString kArgsOption = QStringLiteral("args");
const QString kListOption = QStringLiteral("list-tools");
const QString kWholeOption = QStringLiteral("whole");

} // namespace

void ToolRunner::setupOptions()
{
    m_parser.setApplicationDescription(
        QStringLiteral("Run AeroQuery airport tools against local data."));
    m_parser.addHelpOption();
    m_parser.addVersionOption();
    m_parser.addOptions({
        {kDataDirOption, QStringLiteral("Directory holding the data files."), QStringLiteral("dir")},
        {kSettingsOption, QStringLiteral("Settings JSON file."), QStringLiteral("file")},
        {kToolOption, QStringLiteral("Tool to run."), QStringLiteral("name")},
        {kArgsOption, QStringLiteral("Tool arguments as a JSON object."), QStringLiteral("json")},
        {kListOption, QStringLiteral("List the available tools and exit.")},
        {kWholeOption, QStringLiteral("Treat all of stdin as one model response.")},
    });
}

int ToolRunner::run()
{
    setupOptions();
    m_parser.process(*QCoreApplication::instance());

    if (m_parser.isSet(kListOption)) {
        return listTools();
    }

    Settings settings;
    const QString settingsPath = m_parser.value(kSettingsOption);
    if (m_parser.isSet(kSettingsOption) && !QFileInfo::exists(settingsPath)) {
        LOG_WARN(aqCore, "Settings file not found: %s, using defaults", qUtf8Printable(settingsPath));
    } else if (const std::optional<Settings> loaded = SettingsManager::load(settingsPath)) {
        settings = *loaded;
    }
    if (m_parser.isSet(kDataDirOption)) {
        settings.dataDir = m_parser.value(kDataDirOption);
    }
    settings = SettingsManager::withResolvedPaths(settings);

    m_dispatcher = std::make_unique<ToolDispatcher>(settings);
    if (!m_dispatcher->initialize(DataSources::open(settings))) {
        std::fprintf(stderr, "Failed to open airport data in %s\n",
                     qUtf8Printable(SettingsManager::resolveDataDir(settings)));
        return ExitInitFailed;
    }

    if (m_parser.isSet(kToolOption)) {
        return runSingle(m_parser.value(kToolOption), m_parser.value(kArgsOption));
    }
    return runStdin(m_parser.isSet(kWholeOption));
}

int ToolRunner::listTools() const
{
    for (const ToolInfo& tool : ToolDispatcher::availableTools()) {
        std::fprintf(stdout, "%-34s %s\n", qUtf8Printable(tool.name), qUtf8Printable(tool.description));
    }
    return ExitOk;
}

int ToolRunner::runSingle(const QString& toolName, const QString& argumentsJson) const
{
    QJsonObject arguments;
    if (!argumentsJson.trimmed().isEmpty()) {
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(argumentsJson.toUtf8(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            std::fprintf(stderr, "--args must be a JSON object: %s\n",
                         qUtf8Printable(parseError.errorString()));
            return ExitToolError;
        }
        arguments = doc.object();
    }

    const ToolResult result = m_dispatcher->dispatch(ToolCallRequest{toolName, arguments});
    print(result);
    return result.isSuccess() ? ExitOk : ExitToolError;
}

int ToolRunner::runStdin(bool wholeInput) const
{
    QTextStream in(stdin);
    if (wholeInput) {
        const ToolResult result = m_dispatcher->dispatchText(in.readAll());
        print(result);
        return result.isSuccess() ? ExitOk : ExitToolError;
    }

    int exitCode = ExitOk;
    QString line;
    while (in.readLineInto(&line)) {
        if (line.trimmed().isEmpty()) {
            continue;
        }
        const ToolResult result = m_dispatcher->dispatchText(line);
        print(result);
        if (result.isError()) {
            exitCode = ExitToolError;
        }
    }
    return exitCode;
}

void ToolRunner::print(const ToolResult& result)
{
    std::fprintf(stdout, "%s\n", qUtf8Printable(result.value()));
    std::fflush(stdout);
}

} // namespace aq
