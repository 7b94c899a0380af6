#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>
#include <QTextStream>

#include "todo/cli/CommandLine.hpp"
#include "todo/core/AppContext.hpp"
#include "todo/data/TaskStore.hpp"

using namespace todo;

namespace {

struct RunResult
{
    int exitCode = 0;
    QString out;
    QString err;
};

} // namespace

class CommandLineTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void addThenList();
    void addRejectsInvalidInput();
    void doneAndUndo();
    void missingIdExitsWithFailure();
    void editClearsDueDateOnlyWhenGiven();
    void listFilters();
    void statsAndClear();
    void corruptFileIsStorageFailure();
    void unwritableFileIsStorageFailure();
    void unknownCommandSkipsCorruptFile();
    void subcommandHelpSkipsCorruptFile();
    void runnerIsReusableAfterHelp();
    void noCommandPrintsHelp();
    void unknownCommand();

private:
    RunResult run(const QStringList &arguments);
    data::TaskRecord storedTask(int id);

    QTemporaryDir m_dir;
    QString m_file;
};

void CommandLineTest::init()
{
    QVERIFY(m_dir.isValid());
    m_file = m_dir.filePath(QStringLiteral("%1.json").arg(QString::fromLatin1(QTest::currentTestFunction())));
}

RunResult CommandLineTest::run(const QStringList &arguments)
{
    RunResult result;
    QTextStream out(&result.out);
    QTextStream err(&result.err);
    cli::CommandLine commandLine(out, err);
    result.exitCode = commandLine.run(QStringList{ QStringLiteral("todo"), QStringLiteral("--file"), m_file }
                                      + arguments);
    out.flush();
    err.flush();
    return result;
}

data::TaskRecord CommandLineTest::storedTask(int id)
{
    core::StoreConfig config;
    config.dataFile = m_file;
    core::AppContext context(config);
    for (const auto &task : context.taskStore().tasks()) {
        if (task.id == id) {
            return task;
        }
    }
    return {};
}

void CommandLineTest::addThenList()
{
    auto result = run({ QStringLiteral("add"), QStringLiteral("Buy groceries"), QStringLiteral("--priority"),
                        QStringLiteral("high"), QStringLiteral("--due"), QStringLiteral("2025-12-25"),
                        QStringLiteral("-c"), QStringLiteral("Shopping") });
    QCOMPARE(result.exitCode, 0);
    QCOMPARE(result.out,
             QString::fromUtf8("✓ Added: ○ [1] 🔴 Buy groceries (due: 2025-12-25) [shopping]\n"));

    result = run({ QStringLiteral("add"), QStringLiteral("Call mom") });
    QCOMPARE(result.exitCode, 0);

    result = run({ QStringLiteral("list") });
    QCOMPARE(result.exitCode, 0);
    const int high = result.out.indexOf(QStringLiteral("Buy groceries"));
    const int medium = result.out.indexOf(QString::fromUtf8("○ [2] 🟡 Call mom [general]"));
    QVERIFY(high >= 0);
    QVERIFY(medium > high);
    QVERIFY(result.out.contains(QStringLiteral("Showing 2 item(s)")));
    QVERIFY(QFile::exists(m_file));
}

void CommandLineTest::addRejectsInvalidInput()
{
    auto result = run({ QStringLiteral("add"), QStringLiteral("Task"), QStringLiteral("-p"), QStringLiteral("urgent") });
    QCOMPARE(result.exitCode, 1);
    QVERIFY(result.err.contains(QStringLiteral("urgent")));

    result = run({ QStringLiteral("add"), QStringLiteral("Task"), QStringLiteral("--due"), QStringLiteral("2025-13-40") });
    QCOMPARE(result.exitCode, 1);

    result = run({ QStringLiteral("add") });
    QCOMPARE(result.exitCode, 1);

    QVERIFY(!QFile::exists(m_file));
}

void CommandLineTest::doneAndUndo()
{
    auto result = run({ QStringLiteral("add"), QStringLiteral("Task") });
    QCOMPARE(result.exitCode, 0);

    result = run({ QStringLiteral("done"), QStringLiteral("1") });
    QCOMPARE(result.exitCode, 0);
    QCOMPARE(result.out, QString::fromUtf8("✓ Marked todo #1 as completed\n"));
    QVERIFY(storedTask(1).completed);

    result = run({ QStringLiteral("list") });
    QCOMPARE(result.out, QStringLiteral("No todos found.\n"));

    result = run({ QStringLiteral("undo"), QStringLiteral("1") });
    QCOMPARE(result.exitCode, 0);
    QCOMPARE(result.out, QString::fromUtf8("✓ Marked todo #1 as not completed\n"));
    QVERIFY(!storedTask(1).completed);
}

void CommandLineTest::missingIdExitsWithFailure()
{
    const auto added = run({ QStringLiteral("add"), QStringLiteral("Task") });
    QCOMPARE(added.exitCode, 0);

    for (const QString &command : { QStringLiteral("done"), QStringLiteral("undo"), QStringLiteral("delete"),
                                    QStringLiteral("edit") }) {
        const auto result = run({ command, QStringLiteral("9") });
        QCOMPARE(result.exitCode, 1);
        QCOMPARE(result.out, QString::fromUtf8("✗ Todo #9 not found\n"));
    }

    const auto result = run({ QStringLiteral("delete"), QStringLiteral("abc") });
    QCOMPARE(result.exitCode, 1);
    QVERIFY(result.err.contains(QStringLiteral("abc")));

    const auto deleted = run({ QStringLiteral("delete"), QStringLiteral("1") });
    QCOMPARE(deleted.exitCode, 0);
    QCOMPARE(deleted.out, QString::fromUtf8("✓ Deleted todo #1\n"));
}

void CommandLineTest::editClearsDueDateOnlyWhenGiven()
{
    auto result = run({ QStringLiteral("add"), QStringLiteral("Original"), QStringLiteral("--due"),
                        QStringLiteral("2025-05-05") });
    QCOMPARE(result.exitCode, 0);

    result = run({ QStringLiteral("edit"), QStringLiteral("1"), QStringLiteral("--title"), QString(),
                        QStringLiteral("-p"), QStringLiteral("low") });
    QCOMPARE(result.exitCode, 0);
    QCOMPARE(result.out, QString::fromUtf8("✓ Updated todo #1\n"));
    data::TaskRecord task = storedTask(1);
    QCOMPARE(task.title, QStringLiteral("Original"));
    QCOMPARE(task.priority, QStringLiteral("low"));
    QCOMPARE(task.dueDate, QStringLiteral("2025-05-05"));

    result = run({ QStringLiteral("edit"), QStringLiteral("1"), QStringLiteral("--due"), QString() });
    QCOMPARE(result.exitCode, 0);
    task = storedTask(1);
    QVERIFY(task.dueDate.isEmpty());
    QCOMPARE(task.title, QStringLiteral("Original"));
}

void CommandLineTest::listFilters()
{
    run({ QStringLiteral("add"), QStringLiteral("Work task"), QStringLiteral("-c"), QStringLiteral("work") });
    run({ QStringLiteral("add"), QStringLiteral("Personal task"), QStringLiteral("-c"), QStringLiteral("personal") });

    auto result = run({ QStringLiteral("list"), QStringLiteral("--category"), QStringLiteral("Work") });
    QCOMPARE(result.exitCode, 0);
    QVERIFY(result.out.contains(QStringLiteral("Work task")));
    QVERIFY(!result.out.contains(QStringLiteral("Personal task")));

    result = run({ QStringLiteral("list"), QStringLiteral("-c"), QStringLiteral("work"), QStringLiteral("-p"),
                   QStringLiteral("high") });
    QCOMPARE(result.exitCode, 0);
    QCOMPARE(result.out, QStringLiteral("No todos found (category='work', priority='high').\n"));

    run({ QStringLiteral("done"), QStringLiteral("1") });
    result = run({ QStringLiteral("list"), QStringLiteral("--all") });
    QVERIFY(result.out.contains(QStringLiteral("TODO LIST (including completed)")));
    QVERIFY(result.out.contains(QStringLiteral("Showing 2 item(s)")));
}

void CommandLineTest::statsAndClear()
{
    run({ QStringLiteral("add"), QStringLiteral("Task 1"), QStringLiteral("-p"), QStringLiteral("high") });
    run({ QStringLiteral("add"), QStringLiteral("Task 2"), QStringLiteral("-p"), QStringLiteral("low"),
          QStringLiteral("-c"), QStringLiteral("home") });
    run({ QStringLiteral("done"), QStringLiteral("1") });

    auto result = run({ QStringLiteral("stats") });
    QCOMPARE(result.exitCode, 0);
    QVERIFY(result.out.contains(QStringLiteral("Total todos:    2")));
    QVERIFY(result.out.contains(QString::fromUtf8("🔴 High: 0")));
    QVERIFY(result.out.contains(QString::fromUtf8("🟢 Low: 1")));
    QVERIFY(result.out.contains(QString::fromUtf8("• home: 1")));
    QVERIFY(!result.out.contains(QString::fromUtf8("• general")));

    result = run({ QStringLiteral("clear") });
    QCOMPARE(result.exitCode, 0);
    QCOMPARE(result.out, QString::fromUtf8("✓ Cleared 1 completed todo(s)\n"));

    result = run({ QStringLiteral("clear") });
    QCOMPARE(result.out, QString::fromUtf8("✓ Cleared 0 completed todo(s)\n"));
}

void CommandLineTest::corruptFileIsStorageFailure()
{
    QFile file(m_file);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("not json");
    file.close();

    const auto result = run({ QStringLiteral("list") });
    QCOMPARE(result.exitCode, 2);
    QVERIFY(result.err.startsWith(QStringLiteral("Error: ")));
    QVERIFY(result.out.isEmpty());
}

void CommandLineTest::unwritableFileIsStorageFailure()
{
    const QString blocker = m_dir.filePath(QStringLiteral("blocker"));
    QFile file(blocker);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("x");
    file.close();
    m_file = blocker + QStringLiteral("/todos.json");

    const auto result = run({ QStringLiteral("add"), QStringLiteral("X") });
    QCOMPARE(result.exitCode, 2);
    QVERIFY(result.err.startsWith(QStringLiteral("Error: ")));
    QVERIFY(result.out.isEmpty());
}

void CommandLineTest::unknownCommandSkipsCorruptFile()
{
    QFile file(m_file);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("not json");
    file.close();

    const auto result = run({ QStringLiteral("frobnicate") });
    QCOMPARE(result.exitCode, 1);
    QVERIFY(result.err.contains(QStringLiteral("frobnicate")));
}

void CommandLineTest::subcommandHelpSkipsCorruptFile()
{
    QFile file(m_file);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("not json");
    file.close();

    auto result = run({ QStringLiteral("add"), QStringLiteral("--help") });
    QCOMPARE(result.exitCode, 0);
    QVERIFY(result.out.contains(QStringLiteral("Add a new todo.")));

    result = run({ QStringLiteral("list"), QStringLiteral("-p"), QStringLiteral("urgent") });
    QCOMPARE(result.exitCode, 1);

    result = run({ QStringLiteral("list") });
    QCOMPARE(result.exitCode, 2);
}

void CommandLineTest::runnerIsReusableAfterHelp()
{
    QString out;
    QString err;
    QTextStream outStream(&out);
    QTextStream errStream(&err);
    cli::CommandLine commandLine(outStream, errStream);
    const QStringList prefix = { QStringLiteral("todo"), QStringLiteral("--file"), m_file };

    const int help = commandLine.run(prefix + QStringList{ QStringLiteral("list"), QStringLiteral("--help") });
    QCOMPARE(help, 0);
    const int rejected = commandLine.run(prefix + QStringList{ QStringLiteral("list"), QStringLiteral("--bogus") });
    QCOMPARE(rejected, 1);
}

void CommandLineTest::noCommandPrintsHelp()
{
    const auto result = run({});
    QCOMPARE(result.exitCode, 1);
    QVERIFY(result.out.contains(QStringLiteral("add <title>")));
}

void CommandLineTest::unknownCommand()
{
    const auto result = run({ QStringLiteral("frobnicate") });
    QCOMPARE(result.exitCode, 1);
    QVERIFY(result.err.contains(QStringLiteral("frobnicate")));
}

QTEST_GUILESS_MAIN(CommandLineTest)
#include "CommandLineTest.moc"
