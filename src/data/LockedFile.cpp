#include "goalglide/data/LockedFile.hpp"

#include "goalglide/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

namespace goalglide {
namespace data {

LockedFile::LockedFile(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &LockedFile::filePath() const
{
    return m_filePath;
}

QString LockedFile::lockPath() const
{
    const QFileInfo info(m_filePath);
    return info.dir().filePath(info.completeBaseName() + QStringLiteral(".lock"));
}

QString LockedFile::prepareLockPath() const
{
    const QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        throw core::StorageError(QStringLiteral("Could not create directory %1").arg(dir.path()));
    }
    return lockPath();
}

std::optional<QByteArray> LockedFile::read() const
{
    QFile file(m_filePath);
    if (!file.exists()) {
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw core::StorageError(
            QStringLiteral("Could not open %1: %2").arg(m_filePath, file.errorString()));
    }
    return file.readAll();
}

void LockedFile::write(const QByteArray &data) const
{
    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        throw core::StorageError(
            QStringLiteral("Could not open %1 for writing: %2").arg(m_filePath, file.errorString()));
    }
    if (file.write(data) != data.size() || !file.commit()) {
        throw core::StorageError(
            QStringLiteral("Could not write %1: %2").arg(m_filePath, file.errorString()));
    }
    spdlog::debug("Wrote {} bytes to {}", data.size(), core::str(m_filePath));
}

bool LockedFile::remove() const
{
    QFile file(m_filePath);
    if (!file.exists()) {
        return false;
    }
    if (!file.remove()) {
        throw core::StorageError(
            QStringLiteral("Could not remove %1: %2").arg(m_filePath, file.errorString()));
    }
    return true;
}

} // namespace data
} // namespace goalglide
