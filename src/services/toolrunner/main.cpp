#include "tool_runner.h"
#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("aeroquery-tool"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    aq::ToolRunner runner;
    return runner.run();
}
