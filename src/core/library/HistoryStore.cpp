#include "HistoryStore.h"

#include <QDateTime>
#include <QDebug>
#include <algorithm>

static const QByteArray kEntryPrefix = QByteArrayLiteral("entry/");
static const QByteArray kMigrationMarker = QByteArrayLiteral("meta/migration/play_count_v2");

HistoryStore::HistoryStore(const QString& dbPath, QObject* parent)
    : QObject(parent)
    , m_store(dbPath)
{
}

HistoryStore::~HistoryStore()
{
    close();
}

QByteArray HistoryStore::migrationMarkerKey()
{
    return kMigrationMarker;
}

QByteArray HistoryStore::entryKey(const QString& trackId)
{
    return kEntryPrefix + trackId.toUtf8();
}

// ── open / close ────────────────────────────────────────────────────
Result<void> HistoryStore::open()
{
    auto opened = m_store.open();
    if (!opened.ok) {
        qWarning() << "[History] Cannot open history store:" << opened.error;
        return opened;
    }

    auto migrated = migrateOnce();
    if (!migrated.ok) {
        qWarning() << "[History] Migration failed:" << migrated.error;
        m_store.close();
        return Result<void>::failure(migrated.error);
    }
    return Result<void>::success();
}

void HistoryStore::close()
{
    if (m_store.isOpen())
        m_store.flush();
    m_store.close();
}

// ── migrateOnce ─────────────────────────────────────────────────────
Result<bool> HistoryStore::migrateOnce()
{
    auto marked = m_store.contains(kMigrationMarker);
    if (!marked.ok) return Result<bool>::failure(marked.error);
    if (marked.value) return Result<bool>::success(false);

    auto backup = m_store.createBackup();
    if (!backup.ok) return Result<bool>::failure(backup.error);

    auto records = m_store.scan(kEntryPrefix);
    if (!records.ok) return Result<bool>::failure(records.error);

    int rewritten = 0;
    for (const auto& kv : records.value) {
        if (!Records::isLegacyHistoryRecord(kv.value))
            continue;

        auto legacy = Records::decodeLegacyHistoryEntry(kv.value);
        if (!legacy.ok) {
            qWarning() << "[History] Skipping unreadable legacy record" << kv.key << legacy.error;
            continue;
        }

        // Re-key by track id so legacy keys and current keys agree
        const QByteArray key = entryKey(legacy.value.track.id);
        if (key != kv.key) {
            auto removed = m_store.remove(kv.key);
            if (!removed.ok) return Result<bool>::failure(removed.error);
        }
        auto written = m_store.insert(key, Records::encodeHistoryEntry(legacy.value));
        if (!written.ok) return Result<bool>::failure(written.error);
        ++rewritten;
    }

    auto marker = m_store.insert(kMigrationMarker,
                                 QByteArray::number(QDateTime::currentSecsSinceEpoch()));
    if (!marker.ok) return Result<bool>::failure(marker.error);

    auto flushed = m_store.flush();
    if (!flushed.ok) return Result<bool>::failure(flushed.error);

    qDebug() << "[History] Play-count migration complete, rewrote" << rewritten << "records";
    return Result<bool>::success(true);
}

// ── recordPlay ──────────────────────────────────────────────────────
Result<HistoryEntry> HistoryStore::recordPlay(const Track& track)
{
    return recordPlay(track, QDateTime::currentSecsSinceEpoch());
}

Result<HistoryEntry> HistoryStore::recordPlay(const Track& track, qint64 playedAt)
{
    if (!track.isValid())
        return Result<HistoryEntry>::failure(ErrorCategory::NotFound,
                                             QStringLiteral("cannot record a track without id"));

    HistoryEntry stored;
    auto updated = m_store.update(entryKey(track.id),
        [&](const std::optional<QByteArray>& current) -> Result<std::optional<QByteArray>> {
            using R = Result<std::optional<QByteArray>>;
            HistoryEntry entry;
            if (current) {
                auto decoded = Records::isLegacyHistoryRecord(*current)
                    ? Records::decodeLegacyHistoryEntry(*current)
                    : Records::decodeHistoryEntry(*current);
                if (!decoded.ok)
                    return R::failure(decoded.error);
                entry = decoded.value;
                entry.playCount += 1;
            } else {
                entry.playCount = 1;
            }
            entry.track = track;   // refresh metadata from the latest play
            entry.lastPlayedAt = playedAt;
            stored = entry;
            return R::success(Records::encodeHistoryEntry(entry));
        });

    if (!updated.ok) {
        qWarning() << "[History] recordPlay failed for" << track.id << updated.error;
        return Result<HistoryEntry>::failure(updated.error);
    }

    qDebug() << "[History] Recorded play:" << track.id << "count" << stored.playCount;
    emit historyChanged();
    return Result<HistoryEntry>::success(stored);
}

// ── remove / clearAll ───────────────────────────────────────────────
Result<bool> HistoryStore::remove(const QString& trackId)
{
    auto removed = m_store.remove(entryKey(trackId));
    if (removed.ok && removed.value)
        emit historyChanged();
    return removed;
}

Result<void> HistoryStore::clearAll()
{
    // The migration marker lives outside the entry prefix and survives
    auto cleared = m_store.clear(kEntryPrefix);
    if (cleared.ok)
        emit historyChanged();
    return cleared;
}

// ── Queries ─────────────────────────────────────────────────────────
Result<QVector<HistoryEntry>> HistoryStore::loadAll() const
{
    auto records = m_store.scan(kEntryPrefix);
    if (!records.ok)
        return Result<QVector<HistoryEntry>>::failure(records.error);

    QVector<HistoryEntry> entries;
    entries.reserve(records.value.size());
    for (const auto& kv : records.value) {
        auto decoded = Records::decodeHistoryEntry(kv.value);
        if (!decoded.ok) {
            qWarning() << "[History] Skipping unreadable record" << kv.key << decoded.error;
            continue;
        }
        entries.append(decoded.value);
    }
    return Result<QVector<HistoryEntry>>::success(entries);
}

Result<QVector<HistoryEntry>> HistoryStore::recent(int offset, int pageSize) const
{
    auto all = loadAll();
    if (!all.ok) return all;

    QVector<HistoryEntry>& entries = all.value;
    std::sort(entries.begin(), entries.end(), [](const HistoryEntry& a, const HistoryEntry& b) {
        if (a.lastPlayedAt != b.lastPlayedAt)
            return a.lastPlayedAt > b.lastPlayedAt;
        return a.track.id < b.track.id;
    });

    if (offset < 0) offset = 0;
    if (pageSize < 0) pageSize = 0;
    return Result<QVector<HistoryEntry>>::success(entries.mid(offset, pageSize));
}

Result<QVector<HistoryEntry>> HistoryStore::mostPlayed(int limit) const
{
    auto all = loadAll();
    if (!all.ok) return all;

    QVector<HistoryEntry>& entries = all.value;
    std::sort(entries.begin(), entries.end(), [](const HistoryEntry& a, const HistoryEntry& b) {
        if (a.playCount != b.playCount)
            return a.playCount > b.playCount;
        if (a.lastPlayedAt != b.lastPlayedAt)
            return a.lastPlayedAt > b.lastPlayedAt;
        return a.track.id < b.track.id;
    });

    if (limit < 0) limit = 0;
    return Result<QVector<HistoryEntry>>::success(entries.mid(0, limit));
}

Result<std::optional<HistoryEntry>> HistoryStore::lastPlayed() const
{
    using R = Result<std::optional<HistoryEntry>>;
    auto page = recent(0, 1);
    if (!page.ok) return R::failure(page.error);
    if (page.value.isEmpty()) return R::success(std::nullopt);
    return R::success(page.value.first());
}

Result<qint64> HistoryStore::count() const
{
    return m_store.count(kEntryPrefix);
}
