#pragma once

#include <QObject>
#include <QString>
#include <QVector>
#include <optional>

#include "../MusicData.h"
#include "LibraryStore.h"

// Listening history: one entry per track id with play count and recency.
//
// Records live under "entry/<track id>"; the reserved key
// "meta/migration/play_count_v2" marks that legacy (pre play-count) records
// have been upgraded.  open() runs migrateOnce().
class HistoryStore : public QObject {
    Q_OBJECT

public:
    explicit HistoryStore(const QString& dbPath, QObject* parent = nullptr);
    ~HistoryStore() override;

    Result<void> open();
    void close();
    bool isOpen() const { return m_store.isOpen(); }

    // ── Writes ───────────────────────────────────────────────────────
    Result<HistoryEntry> recordPlay(const Track& track);
    Result<HistoryEntry> recordPlay(const Track& track, qint64 playedAt);
    Result<bool> remove(const QString& trackId);
    Result<void> clearAll();

    // ── Queries ──────────────────────────────────────────────────────
    Result<QVector<HistoryEntry>> recent(int offset, int pageSize) const;
    Result<QVector<HistoryEntry>> mostPlayed(int limit) const;
    Result<std::optional<HistoryEntry>> lastPlayed() const;
    Result<qint64> count() const;

    // ── Migration ────────────────────────────────────────────────────
    Result<bool> migrateOnce();   // true when records were rewritten this call
    static QByteArray migrationMarkerKey();
    static QByteArray entryKey(const QString& trackId);

signals:
    void historyChanged();

private:
    Result<QVector<HistoryEntry>> loadAll() const;

    LibraryStore m_store;
};
