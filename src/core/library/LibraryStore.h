#pragma once

#include <QByteArray>
#include <QRecursiveMutex>
#include <QSqlDatabase>
#include <QString>
#include <QVector>
#include <functional>
#include <memory>
#include <optional>

#include "../Result.h"

class QLockFile;

// Durable, ordered byte-key → byte-value store.
//
// One SQLite file per logical store, table kv(key BLOB PRIMARY KEY, value BLOB).
// Keys compare bytewise, so scan() returns entries in key order.  Opening is
// exclusive: a QLockFile beside the database is held for the lifetime of the
// open connection, and a second open() of the same path fails until close().
//
// All operations are serialised on an internal mutex.  update() performs a
// read-modify-write inside one transaction.
class LibraryStore {
public:
    struct KeyValue {
        QByteArray key;
        QByteArray value;
    };

    // Receives the current value (if any).  Return a value to store it,
    // std::nullopt to remove the key, or a failure to abort the transaction.
    using UpdateFn = std::function<Result<std::optional<QByteArray>>(const std::optional<QByteArray>&)>;

    explicit LibraryStore(const QString& dbPath);
    ~LibraryStore();

    LibraryStore(const LibraryStore&) = delete;
    LibraryStore& operator=(const LibraryStore&) = delete;

    Result<void> open();
    void close();
    bool isOpen() const;
    QString path() const { return m_dbPath; }

    // ── Single-key operations ────────────────────────────────────────
    Result<void> insert(const QByteArray& key, const QByteArray& value);
    Result<std::optional<QByteArray>> get(const QByteArray& key) const;
    Result<bool> remove(const QByteArray& key);   // true if the key existed
    Result<bool> contains(const QByteArray& key) const;
    Result<void> update(const QByteArray& key, const UpdateFn& fn);

    // ── Range operations ─────────────────────────────────────────────
    Result<QVector<KeyValue>> scan(const QByteArray& prefix = QByteArray()) const;
    Result<qint64> count(const QByteArray& prefix = QByteArray()) const;
    Result<void> clear(const QByteArray& prefix = QByteArray());

    // ── Durability ───────────────────────────────────────────────────
    Result<void> flush();
    Result<void> createBackup();
    QString backupPath() const { return m_dbPath + QStringLiteral(".backup"); }

private:
    Result<void> ensureOpen() const;
    void releaseConnection();

    QString m_dbPath;
    QString m_connectionName;
    QSqlDatabase m_db;
    std::unique_ptr<QLockFile> m_lock;
    mutable QRecursiveMutex m_mutex;
};
