#include "goalglide/session/SessionStateFile.hpp"

#include "goalglide/core/Errors.hpp"

#include <QJsonDocument>
#include <QJsonParseError>

namespace goalglide {
namespace session {

SessionStateFile::SessionStateFile(QString filePath)
    : m_file(std::move(filePath))
{
}

const QString &SessionStateFile::filePath() const
{
    return m_file.filePath();
}

std::optional<ActiveSessionState> SessionStateFile::load() const
{
    return m_file.withLock([this]() { return readUnlocked(); });
}

std::optional<ActiveSessionState> SessionStateFile::readUnlocked() const
{
    const auto content = m_file.read();
    if (!content) {
        return std::nullopt;
    }

    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(*content, &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        throw core::CorruptDataError(
            QStringLiteral("%1 is not a valid session file: %2").arg(m_file.filePath(), error.errorString()));
    }
    return activeSessionFromJson(document.object());
}

void SessionStateFile::storeUnlocked(const std::optional<ActiveSessionState> &state) const
{
    if (!state) {
        m_file.remove();
        return;
    }
    m_file.write(QJsonDocument(toJson(*state)).toJson(QJsonDocument::Compact));
}

} // namespace session
} // namespace goalglide
