#include "LibraryStore.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLockFile>
#include <QMutexLocker>
#include <QSqlError>
#include <QSqlQuery>
#include <QUuid>
#include <QVariant>

static Error storageError(const QString& what, const QSqlError& err)
{
    return Error{ErrorCategory::Storage, what + QStringLiteral(": ") + err.text()};
}

// Smallest key greater than every key starting with prefix.
// Empty when no such bound exists (empty prefix or all 0xFF bytes).
static QByteArray prefixUpperBound(const QByteArray& prefix)
{
    QByteArray upper = prefix;
    while (!upper.isEmpty()) {
        const int last = upper.size() - 1;
        if (static_cast<quint8>(upper.at(last)) != 0xFF) {
            upper[last] = static_cast<char>(static_cast<quint8>(upper.at(last)) + 1);
            return upper;
        }
        upper.chop(1);
    }
    return upper;
}

// Appends the WHERE clause for a prefix range and returns the bind values.
static QVariantList prefixClause(const QByteArray& prefix, QString& sql)
{
    QVariantList binds;
    if (prefix.isEmpty())
        return binds;

    sql += QStringLiteral(" WHERE key >= ?");
    binds.append(prefix);
    QByteArray upper = prefixUpperBound(prefix);
    if (!upper.isEmpty()) {
        sql += QStringLiteral(" AND key < ?");
        binds.append(upper);
    }
    return binds;
}

LibraryStore::LibraryStore(const QString& dbPath)
    : m_dbPath(dbPath)
    , m_connectionName(QStringLiteral("library_store_")
                       + QUuid::createUuid().toString(QUuid::WithoutBraces))
{
}

LibraryStore::~LibraryStore()
{
    close();
}

// ── open / close ────────────────────────────────────────────────────
Result<void> LibraryStore::open()
{
    QMutexLocker lock(&m_mutex);
    if (m_db.isOpen()) return Result<void>::success();

    QFileInfo info(m_dbPath);
    if (!QDir().mkpath(info.absolutePath())) {
        return Result<void>::failure(ErrorCategory::Storage,
            QStringLiteral("cannot create directory %1").arg(info.absolutePath()));
    }

    // Single writer: refuse to open while another store holds the lock
    m_lock = std::make_unique<QLockFile>(m_dbPath + QStringLiteral(".lock"));
    m_lock->setStaleLockTime(0);
    if (!m_lock->tryLock(100)) {
        m_lock.reset();
        qWarning() << "[LibraryStore] Already locked by another writer:" << m_dbPath;
        return Result<void>::failure(ErrorCategory::Storage,
            QStringLiteral("store %1 is already open by another writer").arg(m_dbPath));
    }

    m_db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_connectionName);
    m_db.setDatabaseName(m_dbPath);

    if (!m_db.open()) {
        Error err = storageError(QStringLiteral("open %1").arg(m_dbPath), m_db.lastError());
        qWarning() << "[LibraryStore] Failed to open:" << err;
        releaseConnection();
        return Result<void>::failure(err);
    }

    QSqlQuery pragma(m_db);
    if (pragma.exec(QStringLiteral("PRAGMA journal_mode=WAL")) && pragma.next()) {
        QString mode = pragma.value(0).toString().toLower();
        if (mode != QStringLiteral("wal"))
            qWarning() << "[LibraryStore] WAL mode not activated, got:" << mode;
    }
    pragma.exec(QStringLiteral("PRAGMA synchronous=NORMAL"));

    QSqlQuery create(m_db);
    if (!create.exec(QStringLiteral(
            "CREATE TABLE IF NOT EXISTS kv ("
            "  key BLOB PRIMARY KEY,"
            "  value BLOB NOT NULL"
            ") WITHOUT ROWID"))) {
        Error err = storageError(QStringLiteral("create table"), create.lastError());
        qWarning() << "[LibraryStore]" << err;
        releaseConnection();
        return Result<void>::failure(err);
    }

    qDebug() << "[LibraryStore] Opened at" << m_dbPath;
    return Result<void>::success();
}

void LibraryStore::close()
{
    QMutexLocker lock(&m_mutex);
    if (!m_db.isOpen() && !m_lock) return;
    releaseConnection();
    qDebug() << "[LibraryStore] Closed" << m_dbPath;
}

bool LibraryStore::isOpen() const
{
    QMutexLocker lock(&m_mutex);
    return m_db.isOpen();
}

void LibraryStore::releaseConnection()
{
    bool hadConnection = m_db.isValid();
    if (m_db.isOpen())
        m_db.close();
    m_db = QSqlDatabase();   // drop reference before removeDatabase
    if (hadConnection)
        QSqlDatabase::removeDatabase(m_connectionName);
    if (m_lock) {
        m_lock->unlock();
        m_lock.reset();
    }
}

Result<void> LibraryStore::ensureOpen() const
{
    if (!m_db.isOpen())
        return Result<void>::failure(ErrorCategory::Storage,
            QStringLiteral("store %1 is not open").arg(m_dbPath));
    return Result<void>::success();
}

// ── Single-key operations ───────────────────────────────────────────
Result<void> LibraryStore::insert(const QByteArray& key, const QByteArray& value)
{
    QMutexLocker lock(&m_mutex);
    auto ready = ensureOpen();
    if (!ready.ok) return ready;

    QSqlQuery q(m_db);
    q.prepare(QStringLiteral("INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?)"));
    q.addBindValue(key);
    q.addBindValue(value);
    if (!q.exec())
        return Result<void>::failure(storageError(QStringLiteral("insert"), q.lastError()));
    return Result<void>::success();
}

Result<std::optional<QByteArray>> LibraryStore::get(const QByteArray& key) const
{
    using R = Result<std::optional<QByteArray>>;
    QMutexLocker lock(&m_mutex);
    auto ready = ensureOpen();
    if (!ready.ok) return R::failure(ready.error);

    QSqlQuery q(m_db);
    q.prepare(QStringLiteral("SELECT value FROM kv WHERE key = ?"));
    q.addBindValue(key);
    if (!q.exec())
        return R::failure(storageError(QStringLiteral("get"), q.lastError()));
    if (!q.next())
        return R::success(std::nullopt);
    return R::success(q.value(0).toByteArray());
}

Result<bool> LibraryStore::remove(const QByteArray& key)
{
    QMutexLocker lock(&m_mutex);
    auto ready = ensureOpen();
    if (!ready.ok) return Result<bool>::failure(ready.error);

    QSqlQuery q(m_db);
    q.prepare(QStringLiteral("DELETE FROM kv WHERE key = ?"));
    q.addBindValue(key);
    if (!q.exec())
        return Result<bool>::failure(storageError(QStringLiteral("remove"), q.lastError()));
    return Result<bool>::success(q.numRowsAffected() > 0);
}

Result<bool> LibraryStore::contains(const QByteArray& key) const
{
    auto found = get(key);
    if (!found.ok) return Result<bool>::failure(found.error);
    return Result<bool>::success(found.value.has_value());
}

Result<void> LibraryStore::update(const QByteArray& key, const UpdateFn& fn)
{
    QMutexLocker lock(&m_mutex);
    auto ready = ensureOpen();
    if (!ready.ok) return ready;

    if (!m_db.transaction())
        return Result<void>::failure(storageError(QStringLiteral("begin transaction"), m_db.lastError()));

    auto current = get(key);
    if (!current.ok) {
        m_db.rollback();
        return Result<void>::failure(current.error);
    }

    auto next = fn(current.value);
    if (!next.ok) {
        m_db.rollback();
        return Result<void>::failure(next.error);
    }

    QSqlQuery q(m_db);
    if (next.value.has_value()) {
        q.prepare(QStringLiteral("INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?)"));
        q.addBindValue(key);
        q.addBindValue(*next.value);
    } else {
        q.prepare(QStringLiteral("DELETE FROM kv WHERE key = ?"));
        q.addBindValue(key);
    }
    if (!q.exec()) {
        Error err = storageError(QStringLiteral("update"), q.lastError());
        m_db.rollback();
        return Result<void>::failure(err);
    }

    if (!m_db.commit()) {
        Error err = storageError(QStringLiteral("commit"), m_db.lastError());
        m_db.rollback();
        return Result<void>::failure(err);
    }
    return Result<void>::success();
}

// ── Range operations ────────────────────────────────────────────────
Result<QVector<LibraryStore::KeyValue>> LibraryStore::scan(const QByteArray& prefix) const
{
    using R = Result<QVector<KeyValue>>;
    QMutexLocker lock(&m_mutex);
    auto ready = ensureOpen();
    if (!ready.ok) return R::failure(ready.error);

    QString sql = QStringLiteral("SELECT key, value FROM kv");
    const QVariantList binds = prefixClause(prefix, sql);
    sql += QStringLiteral(" ORDER BY key");

    QSqlQuery q(m_db);
    q.setForwardOnly(true);
    q.prepare(sql);
    for (const auto& b : binds)
        q.addBindValue(b);
    if (!q.exec())
        return R::failure(storageError(QStringLiteral("scan"), q.lastError()));

    QVector<KeyValue> result;
    while (q.next())
        result.append(KeyValue{q.value(0).toByteArray(), q.value(1).toByteArray()});
    return R::success(result);
}

Result<qint64> LibraryStore::count(const QByteArray& prefix) const
{
    QMutexLocker lock(&m_mutex);
    auto ready = ensureOpen();
    if (!ready.ok) return Result<qint64>::failure(ready.error);

    QString sql = QStringLiteral("SELECT COUNT(*) FROM kv");
    const QVariantList binds = prefixClause(prefix, sql);

    QSqlQuery q(m_db);
    q.prepare(sql);
    for (const auto& b : binds)
        q.addBindValue(b);
    if (!q.exec() || !q.next())
        return Result<qint64>::failure(storageError(QStringLiteral("count"), q.lastError()));
    return Result<qint64>::success(q.value(0).toLongLong());
}

Result<void> LibraryStore::clear(const QByteArray& prefix)
{
    QMutexLocker lock(&m_mutex);
    auto ready = ensureOpen();
    if (!ready.ok) return ready;

    QString sql = QStringLiteral("DELETE FROM kv");
    const QVariantList binds = prefixClause(prefix, sql);

    QSqlQuery q(m_db);
    q.prepare(sql);
    for (const auto& b : binds)
        q.addBindValue(b);
    if (!q.exec())
        return Result<void>::failure(storageError(QStringLiteral("clear"), q.lastError()));
    return Result<void>::success();
}

// ── Durability ──────────────────────────────────────────────────────
Result<void> LibraryStore::flush()
{
    QMutexLocker lock(&m_mutex);
    auto ready = ensureOpen();
    if (!ready.ok) return ready;

    QSqlQuery q(m_db);
    if (!q.exec(QStringLiteral("PRAGMA wal_checkpoint(FULL)")))
        return Result<void>::failure(storageError(QStringLiteral("flush"), q.lastError()));
    return Result<void>::success();
}

Result<void> LibraryStore::createBackup()
{
    QMutexLocker lock(&m_mutex);
    auto flushed = flush();
    if (!flushed.ok) return flushed;

    const QString backupFile = backupPath();
    if (QFile::exists(backupFile))
        QFile::remove(backupFile);

    if (!QFile::copy(m_dbPath, backupFile)) {
        qWarning() << "[LibraryStore] Backup FAILED for" << m_dbPath;
        return Result<void>::failure(ErrorCategory::Storage,
            QStringLiteral("cannot copy %1 to %2").arg(m_dbPath, backupFile));
    }
    qDebug() << "[LibraryStore] Backup created:" << backupFile;
    return Result<void>::success();
}
