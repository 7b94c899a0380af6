#pragma once

#include <memory>

#include <QString>
#include <QStringList>

#include "todo/core/StoreConfig.hpp"

class QCommandLineParser;
class QTextStream;

namespace todo {
namespace core {
class AppContext;
}

namespace data {
class TaskStore;
}

namespace cli {

class CommandLine
{
public:
    enum ExitCode
    {
        Success = 0,
        Failure = 1,
        StorageFailure = 2,
    };

    CommandLine(QTextStream &out, QTextStream &err);
    ~CommandLine();

    // arguments[0] is the program name, as in QCoreApplication::arguments().
    int run(const QStringList &arguments);

private:
    int dispatch(const QString &command, const QStringList &arguments);
    // Opens the data file on first use. Throws StorageReadError.
    data::TaskStore &store();

    int runAdd(const QStringList &arguments);
    int runList(const QStringList &arguments);
    int runToggle(const QString &command, const QStringList &arguments);
    int runDelete(const QStringList &arguments);
    int runEdit(const QStringList &arguments);
    int runStats(const QStringList &arguments);
    int runClear(const QStringList &arguments);

    bool parseSubcommand(QCommandLineParser &parser, const QStringList &arguments);
    bool parseId(const QCommandLineParser &parser, int &id);
    bool checkPriority(const QString &priority);
    bool checkDueDate(const QString &dueDate);
    int reportNotFound(int id);
    int usageError(const QString &message);

    QTextStream &m_out;
    QTextStream &m_err;
    QString m_program;
    core::StoreConfig m_config;
    std::unique_ptr<core::AppContext> m_context;
    bool m_helpShown = false;
};

} // namespace cli
} // namespace todo
