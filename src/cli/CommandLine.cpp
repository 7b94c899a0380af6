#include "todo/cli/CommandLine.hpp"

#include "todo/cli/TaskFormatter.hpp"
#include "todo/core/AppContext.hpp"
#include "todo/core/Logging.hpp"
#include "todo/core/StoreConfig.hpp"
#include "todo/data/StorageError.hpp"
#include "todo/data/TaskStore.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDate>
#include <QSettings>
#include <QTextStream>

namespace todo {
namespace cli {

namespace {
const QStringList PRIORITIES = {
    QStringLiteral("high"),
    QStringLiteral("medium"),
    QStringLiteral("low"),
};

const QString CROSS_MARK = QString::fromUtf8("✗");
const QString CHECK_MARK = QString::fromUtf8("✓");

QCommandLineOption priorityOption(const QString &description, const QString &defaultValue = QString())
{
    QCommandLineOption option({ QStringLiteral("p"), QStringLiteral("priority") },
                              description + QStringLiteral(" (high, medium, low)"),
                              QStringLiteral("priority"));
    if (!defaultValue.isEmpty()) {
        option.setDefaultValue(defaultValue);
    }
    return option;
}

QCommandLineOption categoryOption(const QString &description, const QString &defaultValue = QString())
{
    QCommandLineOption option({ QStringLiteral("c"), QStringLiteral("category") }, description,
                              QStringLiteral("category"));
    if (!defaultValue.isEmpty()) {
        option.setDefaultValue(defaultValue);
    }
    return option;
}

QCommandLineOption dueOption(const QString &description)
{
    return QCommandLineOption({ QStringLiteral("d"), QStringLiteral("due") }, description,
                              QStringLiteral("YYYY-MM-DD"));
}
} // namespace

CommandLine::CommandLine(QTextStream &out, QTextStream &err)
    : m_out(out)
    , m_err(err)
{
}

CommandLine::~CommandLine() = default;

int CommandLine::run(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Command-line todo list manager with priorities, due dates and categories.\n"
        "\n"
        "Commands:\n"
        "  add <title>   Add a new todo\n"
        "  list          List todos\n"
        "  done <id>     Mark todo as completed\n"
        "  undo <id>     Mark todo as not completed\n"
        "  delete <id>   Delete a todo\n"
        "  edit <id>     Edit a todo\n"
        "  stats         Show statistics\n"
        "  clear         Remove all completed todos\n"
        "\n"
        "Examples:\n"
        "  todo add \"Buy groceries\" --priority high --due 2025-12-25 --category shopping\n"
        "  todo list --category work --priority high\n"
        "  todo done 1"));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();
    const QCommandLineOption fileOption({ QStringLiteral("f"), QStringLiteral("file") },
                                        QStringLiteral("Data file (default: todos.json)."),
                                        QStringLiteral("path"));
    parser.addOption(fileOption);
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command to run."),
                                 QStringLiteral("<command> [<args>]"));
    parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);

    m_helpShown = false;
    m_context.reset();
    m_program = arguments.isEmpty() ? QStringLiteral("todo") : arguments.first();
    if (!parser.parse(arguments)) {
        return usageError(parser.errorText());
    }
    if (parser.isSet(helpOption)) {
        m_out << parser.helpText();
        return Success;
    }
    if (parser.isSet(versionOption)) {
        m_out << QCoreApplication::applicationName() << ' ' << QCoreApplication::applicationVersion() << '\n';
        return Success;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        m_out << parser.helpText();
        return Failure;
    }
    const QString command = positional.first();
    const QStringList commandArguments = positional.mid(1);

    const QSettings settings;
    m_config = core::StoreConfig::resolve(parser.value(fileOption), settings);
    qCDebug(lcTodoCli) << "Running" << command << "against" << m_config.dataFile;

    try {
        return dispatch(command, commandArguments);
    } catch (const data::StorageError &error) {
        m_err << "Error: " << QString::fromUtf8(error.what()) << '\n';
        return StorageFailure;
    }
}

data::TaskStore &CommandLine::store()
{
    if (!m_context) {
        m_context = std::make_unique<core::AppContext>(m_config);
    }
    return m_context->taskStore();
}

int CommandLine::dispatch(const QString &command, const QStringList &arguments)
{
    if (command == QLatin1String("add")) {
        return runAdd(arguments);
    }
    if (command == QLatin1String("list")) {
        return runList(arguments);
    }
    if (command == QLatin1String("done") || command == QLatin1String("undo")) {
        return runToggle(command, arguments);
    }
    if (command == QLatin1String("delete")) {
        return runDelete(arguments);
    }
    if (command == QLatin1String("edit")) {
        return runEdit(arguments);
    }
    if (command == QLatin1String("stats")) {
        return runStats(arguments);
    }
    if (command == QLatin1String("clear")) {
        return runClear(arguments);
    }
    return usageError(QStringLiteral("Unknown command '%1'.").arg(command));
}

int CommandLine::runAdd(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Add a new todo."));
    const QCommandLineOption priority = priorityOption(QStringLiteral("Priority level"), QStringLiteral("medium"));
    const QCommandLineOption due = dueOption(QStringLiteral("Due date."));
    const QCommandLineOption category = categoryOption(QStringLiteral("Category (default: general)."),
                                                       QStringLiteral("general"));
    parser.addOptions({ priority, due, category });
    parser.addPositionalArgument(QStringLiteral("title"), QStringLiteral("Todo title."), QStringLiteral("add <title>"));
    if (!parseSubcommand(parser, arguments)) {
        return m_helpShown ? Success : Failure;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        return usageError(QStringLiteral("add expects exactly one title."));
    }
    if (!checkPriority(parser.value(priority)) || !checkDueDate(parser.value(due))) {
        return Failure;
    }

    const data::TaskRecord task = store().add(positional.first(), parser.value(priority), parser.value(due),
                                            parser.value(category));
    m_out << CHECK_MARK << " Added: " << TaskFormatter::formatTask(task) << '\n';
    return Success;
}

int CommandLine::runList(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("List todos."));
    const QCommandLineOption all({ QStringLiteral("a"), QStringLiteral("all") },
                                 QStringLiteral("Show completed todos too."));
    const QCommandLineOption category = categoryOption(QStringLiteral("Filter by category."));
    const QCommandLineOption priority = priorityOption(QStringLiteral("Filter by priority"));
    parser.addOptions({ all, category, priority });
    if (!parseSubcommand(parser, arguments)) {
        return m_helpShown ? Success : Failure;
    }
    if (!parser.positionalArguments().isEmpty()) {
        return usageError(QStringLiteral("list takes no positional arguments."));
    }

    data::TaskQuery query;
    query.showAll = parser.isSet(all);
    query.category = parser.value(category);
    query.priority = parser.value(priority);
    if (!query.priority.isEmpty() && !checkPriority(query.priority)) {
        return Failure;
    }

    const auto tasks = store().list(query);
    if (tasks.empty()) {
        m_out << TaskFormatter::formatEmptyList(query);
    } else {
        m_out << TaskFormatter::formatList(tasks, query.showAll);
    }
    return Success;
}

int CommandLine::runToggle(const QString &command, const QStringList &arguments)
{
    const bool completing = command == QLatin1String("done");
    QCommandLineParser parser;
    parser.setApplicationDescription(completing ? QStringLiteral("Mark todo as completed.")
                                                : QStringLiteral("Mark todo as not completed."));
    parser.addPositionalArgument(QStringLiteral("id"), QStringLiteral("Todo ID."), command + QStringLiteral(" <id>"));
    int id = 0;
    if (!parseSubcommand(parser, arguments)) {
        return m_helpShown ? Success : Failure;
    }
    if (!parseId(parser, id)) {
        return Failure;
    }

    if (completing ? !store().complete(id) : !store().uncomplete(id)) {
        return reportNotFound(id);
    }
    m_out << CHECK_MARK << QStringLiteral(" Marked todo #%1 as %2\n")
                               .arg(QString::number(id),
                                    completing ? QStringLiteral("completed") : QStringLiteral("not completed"));
    return Success;
}

int CommandLine::runDelete(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Delete a todo."));
    parser.addPositionalArgument(QStringLiteral("id"), QStringLiteral("Todo ID."), QStringLiteral("delete <id>"));
    int id = 0;
    if (!parseSubcommand(parser, arguments)) {
        return m_helpShown ? Success : Failure;
    }
    if (!parseId(parser, id)) {
        return Failure;
    }

    if (!store().remove(id)) {
        return reportNotFound(id);
    }
    m_out << CHECK_MARK << " Deleted todo #" << id << '\n';
    return Success;
}

int CommandLine::runEdit(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Edit a todo. An empty --due clears the due date."));
    const QCommandLineOption title({ QStringLiteral("t"), QStringLiteral("title") }, QStringLiteral("New title."),
                                   QStringLiteral("title"));
    const QCommandLineOption priority = priorityOption(QStringLiteral("New priority"));
    const QCommandLineOption due = dueOption(QStringLiteral("New due date."));
    const QCommandLineOption category = categoryOption(QStringLiteral("New category."));
    parser.addOptions({ title, priority, due, category });
    parser.addPositionalArgument(QStringLiteral("id"), QStringLiteral("Todo ID."), QStringLiteral("edit <id>"));
    int id = 0;
    if (!parseSubcommand(parser, arguments)) {
        return m_helpShown ? Success : Failure;
    }
    if (!parseId(parser, id)) {
        return Failure;
    }

    data::TaskEdit changes;
    if (parser.isSet(title)) {
        changes.title = parser.value(title);
    }
    if (parser.isSet(priority)) {
        if (!checkPriority(parser.value(priority))) {
            return Failure;
        }
        changes.priority = parser.value(priority);
    }
    if (parser.isSet(due)) {
        if (!checkDueDate(parser.value(due))) {
            return Failure;
        }
        changes.dueDate = parser.value(due);
    }
    if (parser.isSet(category)) {
        changes.category = parser.value(category);
    }

    if (!store().edit(id, changes)) {
        return reportNotFound(id);
    }
    m_out << CHECK_MARK << " Updated todo #" << id << '\n';
    return Success;
}

int CommandLine::runStats(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Show statistics."));
    if (!parseSubcommand(parser, arguments)) {
        return m_helpShown ? Success : Failure;
    }
    m_out << TaskFormatter::formatStats(store().stats());
    return Success;
}

int CommandLine::runClear(const QStringList &arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Remove all completed todos."));
    if (!parseSubcommand(parser, arguments)) {
        return m_helpShown ? Success : Failure;
    }
    const int removed = store().clearCompleted();
    m_out << CHECK_MARK << " Cleared " << removed << " completed todo(s)\n";
    return Success;
}

bool CommandLine::parseSubcommand(QCommandLineParser &parser, const QStringList &arguments)
{
    const QCommandLineOption helpOption = parser.addHelpOption();
    if (!parser.parse(QStringList{ m_program } + arguments)) {
        usageError(parser.errorText());
        return false;
    }
    if (parser.isSet(helpOption)) {
        m_out << parser.helpText();
        m_helpShown = true;
        return false;
    }
    return true;
}

bool CommandLine::parseId(const QCommandLineParser &parser, int &id)
{
    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        usageError(QStringLiteral("Expected exactly one todo ID."));
        return false;
    }
    bool ok = false;
    id = positional.first().toInt(&ok);
    if (!ok) {
        usageError(QStringLiteral("Invalid todo ID '%1'.").arg(positional.first()));
        return false;
    }
    return true;
}

bool CommandLine::checkPriority(const QString &priority)
{
    if (PRIORITIES.contains(priority)) {
        return true;
    }
    usageError(QStringLiteral("Invalid priority '%1' (choose from %2).")
                   .arg(priority, PRIORITIES.join(QStringLiteral(", "))));
    return false;
}

bool CommandLine::checkDueDate(const QString &dueDate)
{
    if (dueDate.isEmpty()) {
        return true;
    }
    const QDate date = QDate::fromString(dueDate, QStringLiteral("yyyy-MM-dd"));
    if (date.isValid()) {
        return true;
    }
    usageError(QStringLiteral("Invalid due date '%1' (expected YYYY-MM-DD).").arg(dueDate));
    return false;
}

int CommandLine::reportNotFound(int id)
{
    m_out << CROSS_MARK << " Todo #" << id << " not found\n";
    return Failure;
}

int CommandLine::usageError(const QString &message)
{
    qCInfo(lcTodoCli) << "Rejected input:" << message;
    m_err << "Error: " << message << '\n';
    return Failure;
}

} // namespace cli
} // namespace todo
