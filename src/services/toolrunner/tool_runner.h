#pragma once

#include "core/tools/tool_dispatcher.h"

#include <QCommandLineParser>
#include <QString>

namespace aq {

// ToolRunner -- command-line front end over a ToolDispatcher.
//
// Either runs one tool given by --tool/--args, or reads model output from
// stdin and executes the tool call embedded in it (per line, or the whole
// input with --whole). Results go to stdout as ToolResult::value().
class ToolRunner {
public:
    enum ExitCode {
        ExitOk = 0,
        ExitToolError = 1,
        ExitInitFailed = 2,
    };

    ToolRunner() = default;

    // Parses the application's arguments and runs. Returns the exit code.
    int run();

private:
    void setupOptions();
    int listTools() const;
    int runSingle(const QString& toolName, const QString& argumentsJson) const;
    int runStdin(bool wholeInput) const;

    static void print(const ToolResult& result);

    QCommandLineParser m_parser;
    std::unique_ptr<ToolDispatcher> m_dispatcher;
};

} // namespace aq
