#include "todo/core/StoreConfig.hpp"

#include <QDir>
#include <QSettings>
#include <QtGlobal>

namespace todo {
namespace core {

namespace {
constexpr auto ENV_DATA_FILE = "TODO_FILE";
constexpr auto SETTINGS_DATA_FILE = "storage/dataFile";
} // namespace

QString StoreConfig::defaultDataFile()
{
    return QDir::current().filePath(QStringLiteral("todos.json"));
}

StoreConfig StoreConfig::resolve(const QString &overridePath, const QSettings &settings)
{
    StoreConfig config;
    if (!overridePath.isEmpty()) {
        config.dataFile = overridePath;
        return config;
    }

    const QString fromEnvironment = qEnvironmentVariable(ENV_DATA_FILE);
    if (!fromEnvironment.isEmpty()) {
        config.dataFile = fromEnvironment;
        return config;
    }

    const QString fromSettings = settings.value(QLatin1String(SETTINGS_DATA_FILE)).toString();
    if (!fromSettings.isEmpty()) {
        config.dataFile = fromSettings;
        return config;
    }

    config.dataFile = defaultDataFile();
    return config;
}

} // namespace core
} // namespace todo
