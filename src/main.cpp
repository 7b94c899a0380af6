#include <QCoreApplication>
#include <QString>
#include <QTextStream>
#include <cstdio>

#include "version.h"

#include "todo/cli/CommandLine.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Zellhoff"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("zellhoff.at"));
    QCoreApplication::setApplicationName(QStringLiteral("todo"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTodoVersion));

    QCoreApplication app(argc, argv);

    QTextStream out(stdout);
    QTextStream err(stderr);
    out.setCodec("UTF-8");
    err.setCodec("UTF-8");

    todo::cli::CommandLine commandLine(out, err);
    return commandLine.run(QCoreApplication::arguments());
}
