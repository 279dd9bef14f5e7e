#pragma once

#include "goalglide/data/LockedFile.hpp"

#include <QJsonObject>
#include <QString>

#include <map>
#include <type_traits>

namespace goalglide {
namespace data {

// Rows of one table keyed by their numeric document id.
using DocumentRows = std::map<int, QJsonObject>;

// A JSON file holding named tables: { "<table>": { "<doc id>": {row}, ... } }.
// Every access re-reads the file under the lock; nothing is cached between
// calls, so separate processes always see each other's writes.
class JsonDocumentStore
{
public:
    explicit JsonDocumentStore(QString filePath);

    const QString &filePath() const;

    DocumentRows readTable(const QString &table) const;

    // Read-modify-write of one table under the lock. fn receives the rows and
    // may change them; the file is rewritten only when the rows changed.
    template <typename Fn>
    decltype(auto) modifyTable(const QString &table, Fn &&fn)
    {
        return m_file.withLock([&]() -> decltype(auto) {
            QJsonObject root = loadRoot();
            DocumentRows rows = rowsOf(root, table);
            const DocumentRows before = rows;
            if constexpr (std::is_void_v<std::invoke_result_t<Fn, DocumentRows &>>) {
                fn(rows);
                storeIfChanged(root, table, before, rows);
            } else {
                auto result = fn(rows);
                storeIfChanged(root, table, before, rows);
                return result;
            }
        });
    }

    static int insertRow(DocumentRows &rows, const QJsonObject &row);

private:
    QJsonObject loadRoot() const;
    void storeIfChanged(QJsonObject &root, const QString &table, const DocumentRows &before,
                        const DocumentRows &after) const;
    DocumentRows rowsOf(const QJsonObject &root, const QString &table) const;

    LockedFile m_file;
};

} // namespace data
} // namespace goalglide
