#pragma once

#include <QString>
#include <vector>

#include "todo/data/Task.hpp"
#include "todo/data/TaskStore.hpp"

namespace todo {
namespace cli {

class TaskFormatter
{
public:
    static QString priorityMarker(const QString &priority);

    // "<status> [<id>] <marker> <title> (due: <date>) [<category>]"
    static QString formatTask(const data::TaskRecord &task);
    static QString formatList(const std::vector<data::TaskRecord> &tasks, bool showAll);
    static QString formatEmptyList(const data::TaskQuery &query);
    static QString formatStats(const data::TaskStats &stats);
};

} // namespace cli
} // namespace todo
