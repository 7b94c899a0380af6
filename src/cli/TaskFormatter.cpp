#include "todo/cli/TaskFormatter.hpp"

#include <QStringList>

namespace todo {
namespace cli {

namespace {
const QString CHECK_MARK = QString::fromUtf8("✓");
const QString OPEN_MARK = QString::fromUtf8("○");
const QString BULLET = QString::fromUtf8("•");

QString rule(int width)
{
    return QString(width, QLatin1Char('='));
}

QString capitalized(const QString &text)
{
    if (text.isEmpty()) {
        return text;
    }
    return text.left(1).toUpper() + text.mid(1);
}
} // namespace

QString TaskFormatter::priorityMarker(const QString &priority)
{
    if (priority == QLatin1String("high")) {
        return QString::fromUtf8("🔴");
    }
    if (priority == QLatin1String("medium")) {
        return QString::fromUtf8("🟡");
    }
    if (priority == QLatin1String("low")) {
        return QString::fromUtf8("🟢");
    }
    return QString::fromUtf8("⚪");
}

QString TaskFormatter::formatTask(const data::TaskRecord &task)
{
    const QString status = task.completed ? CHECK_MARK : OPEN_MARK;
    const QString due = task.dueDate.isEmpty() ? QString() : QStringLiteral(" (due: %1)").arg(task.dueDate);
    return QStringLiteral("%1 [%2] %3 %4%5 [%6]")
        .arg(status, QString::number(task.id), priorityMarker(task.priority), task.title, due, task.category);
}

QString TaskFormatter::formatList(const std::vector<data::TaskRecord> &tasks, bool showAll)
{
    QStringList lines;
    lines << QString() << rule(50);
    lines << (showAll ? QStringLiteral("TODO LIST (including completed)") : QStringLiteral("TODO LIST"));
    lines << rule(50);
    for (const auto &task : tasks) {
        lines << formatTask(task);
    }
    lines << rule(50);
    lines << QStringLiteral("Showing %1 item(s)").arg(static_cast<int>(tasks.size()));
    lines << QString();
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString TaskFormatter::formatEmptyList(const data::TaskQuery &query)
{
    QStringList filters;
    if (!query.category.isEmpty()) {
        filters << QStringLiteral("category='%1'").arg(query.category);
    }
    if (!query.priority.isEmpty()) {
        filters << QStringLiteral("priority='%1'").arg(query.priority);
    }
    const QString suffix = filters.isEmpty() ? QString()
                                             : QStringLiteral(" (%1)").arg(filters.join(QStringLiteral(", ")));
    return QStringLiteral("No todos found%1.\n").arg(suffix);
}

QString TaskFormatter::formatStats(const data::TaskStats &stats)
{
    QStringList lines;
    lines << QString() << rule(40) << QStringLiteral("TODO STATISTICS") << rule(40);
    lines << QStringLiteral("Total todos:    %1").arg(stats.total);
    lines << QStringLiteral("Completed:      %1").arg(stats.completed);
    lines << QStringLiteral("Pending:        %1").arg(stats.pending);
    lines << QString() << QStringLiteral("By Priority (pending):");
    for (const auto &entry : stats.byPriority) {
        lines << QStringLiteral("%1 %2: %3")
                     .arg(priorityMarker(entry.first), capitalized(entry.first), QString::number(entry.second));
    }
    if (!stats.byCategory.isEmpty()) {
        lines << QString() << QStringLiteral("By Category (pending):");
        for (auto it = stats.byCategory.constBegin(); it != stats.byCategory.constEnd(); ++it) {
            lines << QStringLiteral("%1 %2: %3").arg(BULLET, it.key(), QString::number(it.value()));
        }
    }
    lines << rule(40) << QString();
    return lines.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

} // namespace cli
} // namespace todo
