#pragma once

#include <QString>

class QSettings;

namespace todo {
namespace core {

struct StoreConfig
{
    QString dataFile;

    static QString defaultDataFile();

    /**
     * Resolves the data file: explicit override, then the TODO_FILE
     * environment variable, then the "storage/dataFile" setting, then
     * todos.json in the working directory.
     */
    static StoreConfig resolve(const QString &overridePath, const QSettings &settings);
};

} // namespace core
} // namespace todo
