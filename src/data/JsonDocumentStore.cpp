#include "goalglide/data/JsonDocumentStore.hpp"

#include "goalglide/core/Errors.hpp"

#include <QJsonDocument>
#include <QJsonParseError>

namespace goalglide {
namespace data {

JsonDocumentStore::JsonDocumentStore(QString filePath)
    : m_file(std::move(filePath))
{
}

const QString &JsonDocumentStore::filePath() const
{
    return m_file.filePath();
}

DocumentRows JsonDocumentStore::readTable(const QString &table) const
{
    return m_file.withLock([&]() { return rowsOf(loadRoot(), table); });
}

int JsonDocumentStore::insertRow(DocumentRows &rows, const QJsonObject &row)
{
    const int id = rows.empty() ? 1 : rows.rbegin()->first + 1;
    rows.emplace(id, row);
    return id;
}

QJsonObject JsonDocumentStore::loadRoot() const
{
    const auto content = m_file.read();
    if (!content || content->trimmed().isEmpty()) {
        return {};
    }

    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(*content, &error);
    if (error.error != QJsonParseError::NoError) {
        throw core::CorruptDataError(QStringLiteral("%1 is not valid JSON: %2 at offset %3")
                                         .arg(m_file.filePath(), error.errorString())
                                         .arg(error.offset));
    }
    if (!document.isObject()) {
        throw core::CorruptDataError(
            QStringLiteral("%1 does not contain a JSON object").arg(m_file.filePath()));
    }
    return document.object();
}

void JsonDocumentStore::storeIfChanged(QJsonObject &root, const QString &table,
                                       const DocumentRows &before, const DocumentRows &after) const
{
    if (before == after) {
        return;
    }

    QJsonObject tableObject;
    for (const auto &entry : after) {
        tableObject.insert(QString::number(entry.first), entry.second);
    }
    root.insert(table, tableObject);
    m_file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
}

DocumentRows JsonDocumentStore::rowsOf(const QJsonObject &root, const QString &table) const
{
    DocumentRows rows;
    const QJsonValue value = root.value(table);
    if (value.isUndefined() || value.isNull()) {
        return rows;
    }
    if (!value.isObject()) {
        throw core::CorruptDataError(
            QStringLiteral("Table '%1' in %2 is not an object").arg(table, m_file.filePath()));
    }

    const QJsonObject tableObject = value.toObject();
    for (auto it = tableObject.constBegin(); it != tableObject.constEnd(); ++it) {
        bool ok = false;
        const int id = it.key().toInt(&ok);
        if (!ok || !it.value().isObject()) {
            throw core::CorruptDataError(QStringLiteral("Malformed row '%1' in table '%2' of %3")
                                             .arg(it.key(), table, m_file.filePath()));
        }
        rows.emplace(id, it.value().toObject());
    }
    return rows;
}

} // namespace data
} // namespace goalglide
