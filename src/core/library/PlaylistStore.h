#pragma once

#include <QObject>
#include <QSharedPointer>
#include <QString>
#include <QStringList>
#include <QVector>

#include "../MusicData.h"
#include "LibraryStore.h"
#include "SongPageStore.h"

// Named, durable playlists.  Each playlist is one record under
// "playlist/<name>", rewritten atomically on every change.
class PlaylistStore : public QObject {
    Q_OBJECT

public:
    explicit PlaylistStore(const QString& dbPath, QObject* parent = nullptr);
    ~PlaylistStore() override;

    Result<void> open();
    void close();
    bool isOpen() const { return m_store.isOpen(); }

    // ── CRUD ─────────────────────────────────────────────────────────
    Result<void> create(const QString& name);
    Result<void> remove(const QString& name);

    // ── Track management ─────────────────────────────────────────────
    // Re-adding an existing track moves it to the end with a fresh index.
    Result<PlaylistEntry> addTrack(const QString& name, const Track& track);
    Result<bool> removeTrack(const QString& name, const QString& trackId);

    // ── Queries ──────────────────────────────────────────────────────
    Result<QStringList> listNames() const;
    Result<Playlist> playlist(const QString& name) const;
    Result<QVector<Track>> tracks(const QString& name) const;
    Result<QSharedPointer<SongPageStore>> materialize(const QString& name) const;

signals:
    void playlistCreated(const QString& name);
    void playlistDeleted(const QString& name);
    void playlistUpdated(const QString& name);
    void trackAdded(const QString& name, const QString& trackId);
    void playlistsChanged();

private:
    static QByteArray playlistKey(const QString& name);

    LibraryStore m_store;
};
