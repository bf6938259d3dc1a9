#include "PlaylistStore.h"

#include <QDebug>
#include <algorithm>

static const QByteArray kPlaylistPrefix = QByteArrayLiteral("playlist/");

static Error notFound(const QString& name)
{
    return Error{ErrorCategory::NotFound, QStringLiteral("playlist '%1' does not exist").arg(name)};
}

PlaylistStore::PlaylistStore(const QString& dbPath, QObject* parent)
    : QObject(parent)
    , m_store(dbPath)
{
}

PlaylistStore::~PlaylistStore()
{
    close();
}

QByteArray PlaylistStore::playlistKey(const QString& name)
{
    return kPlaylistPrefix + name.toUtf8();
}

Result<void> PlaylistStore::open()
{
    auto opened = m_store.open();
    if (!opened.ok)
        qWarning() << "[Playlist] Cannot open playlist store:" << opened.error;
    return opened;
}

void PlaylistStore::close()
{
    if (m_store.isOpen())
        m_store.flush();
    m_store.close();
}

// ── create ──────────────────────────────────────────────────────────
Result<void> PlaylistStore::create(const QString& name)
{
    auto written = m_store.update(playlistKey(name),
        [&](const std::optional<QByteArray>& current) -> Result<std::optional<QByteArray>> {
            using R = Result<std::optional<QByteArray>>;
            if (current)
                return R::failure(ErrorCategory::DuplicateName,
                                  QStringLiteral("playlist '%1' already exists").arg(name));
            Playlist p;
            p.name = name;
            return R::success(Records::encodePlaylist(p));
        });

    if (!written.ok) {
        qWarning() << "[Playlist] create failed:" << written.error;
        return written;
    }

    qDebug() << "[Playlist] Created" << name;
    emit playlistCreated(name);
    emit playlistsChanged();
    return written;
}

// ── remove ──────────────────────────────────────────────────────────
Result<void> PlaylistStore::remove(const QString& name)
{
    auto removed = m_store.remove(playlistKey(name));
    if (!removed.ok)
        return Result<void>::failure(removed.error);
    if (!removed.value)
        return Result<void>::failure(notFound(name));

    qDebug() << "[Playlist] Deleted" << name;
    emit playlistDeleted(name);
    emit playlistsChanged();
    return Result<void>::success();
}

// ── addTrack ────────────────────────────────────────────────────────
Result<PlaylistEntry> PlaylistStore::addTrack(const QString& name, const Track& track)
{
    if (!track.isValid())
        return Result<PlaylistEntry>::failure(ErrorCategory::NotFound,
                                              QStringLiteral("cannot add a track without id"));

    PlaylistEntry added;
    auto written = m_store.update(playlistKey(name),
        [&](const std::optional<QByteArray>& current) -> Result<std::optional<QByteArray>> {
            using R = Result<std::optional<QByteArray>>;
            if (!current)
                return R::failure(notFound(name));

            auto decoded = Records::decodePlaylist(*current);
            if (!decoded.ok)
                return R::failure(decoded.error);

            Playlist p = decoded.value;
            p.entries.erase(std::remove_if(p.entries.begin(), p.entries.end(),
                                           [&](const PlaylistEntry& e) { return e.track == track; }),
                            p.entries.end());

            added.index = p.nextIndex++;
            added.track = track;
            p.entries.append(added);
            return R::success(Records::encodePlaylist(p));
        });

    if (!written.ok) {
        qWarning() << "[Playlist] addTrack failed:" << name << track.id << written.error;
        return Result<PlaylistEntry>::failure(written.error);
    }

    emit playlistUpdated(name);
    emit trackAdded(name, track.id);
    emit playlistsChanged();
    return Result<PlaylistEntry>::success(added);
}

// ── removeTrack ─────────────────────────────────────────────────────
Result<bool> PlaylistStore::removeTrack(const QString& name, const QString& trackId)
{
    bool removed = false;
    auto written = m_store.update(playlistKey(name),
        [&](const std::optional<QByteArray>& current) -> Result<std::optional<QByteArray>> {
            using R = Result<std::optional<QByteArray>>;
            if (!current)
                return R::failure(notFound(name));

            auto decoded = Records::decodePlaylist(*current);
            if (!decoded.ok)
                return R::failure(decoded.error);

            Playlist p = decoded.value;
            const int before = p.entries.size();
            p.entries.erase(std::remove_if(p.entries.begin(), p.entries.end(),
                                           [&](const PlaylistEntry& e) { return e.track.id == trackId; }),
                            p.entries.end());
            removed = p.entries.size() != before;
            if (!removed)
                return R::success(*current);
            return R::success(Records::encodePlaylist(p));
        });

    if (!written.ok)
        return Result<bool>::failure(written.error);

    if (removed) {
        emit playlistUpdated(name);
        emit playlistsChanged();
    }
    return Result<bool>::success(removed);
}

// ── Queries ─────────────────────────────────────────────────────────
Result<QStringList> PlaylistStore::listNames() const
{
    auto records = m_store.scan(kPlaylistPrefix);
    if (!records.ok)
        return Result<QStringList>::failure(records.error);

    QStringList names;
    for (const auto& kv : records.value)
        names.append(QString::fromUtf8(kv.key.mid(kPlaylistPrefix.size())));
    return Result<QStringList>::success(names);
}

Result<Playlist> PlaylistStore::playlist(const QString& name) const
{
    auto record = m_store.get(playlistKey(name));
    if (!record.ok)
        return Result<Playlist>::failure(record.error);
    if (!record.value)
        return Result<Playlist>::failure(notFound(name));
    return Records::decodePlaylist(*record.value);
}

Result<QVector<Track>> PlaylistStore::tracks(const QString& name) const
{
    auto p = playlist(name);
    if (!p.ok)
        return Result<QVector<Track>>::failure(p.error);
    return Result<QVector<Track>>::success(p.value.tracksInOrder());
}

Result<QSharedPointer<SongPageStore>> PlaylistStore::materialize(const QString& name) const
{
    auto list = tracks(name);
    if (!list.ok)
        return Result<QSharedPointer<SongPageStore>>::failure(list.error);
    return Result<QSharedPointer<SongPageStore>>::success(SongPageStore::fromTracks(list.value));
}
