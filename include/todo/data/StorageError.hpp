#pragma once

#include <QString>
#include <stdexcept>

namespace todo {
namespace data {

class RecordFormatError : public std::invalid_argument
{
public:
    explicit RecordFormatError(const QString &message)
        : std::invalid_argument(message.toStdString())
    {
    }
};

class StorageError : public std::runtime_error
{
public:
    StorageError(const QString &filePath, const QString &message)
        : std::runtime_error(QStringLiteral("%1: %2").arg(filePath, message).toStdString())
        , m_filePath(filePath)
    {
    }

    const QString &filePath() const { return m_filePath; }

private:
    QString m_filePath;
};

// The file exists but could not be opened or parsed.
class StorageReadError : public StorageError
{
public:
    using StorageError::StorageError;
};

// The snapshot could not be written. The in-memory state is already changed.
class StorageWriteError : public StorageError
{
public:
    using StorageError::StorageError;
};

} // namespace data
} // namespace todo
