#include "SongPageStore.h"

#include <QMutexLocker>
#include <QSharedPointer>
#include <iterator>

QSharedPointer<SongPageStore> SongPageStore::fromTracks(const QVector<Track>& tracks)
{
    auto store = QSharedPointer<SongPageStore>::create();
    for (const auto& t : tracks)
        store->append(t);
    return store;
}

quint64 SongPageStore::append(const Track& track)
{
    QMutexLocker lock(&m_mutex);
    const quint64 position = m_nextPosition++;
    m_tracks.insert(position, track);
    return position;
}

Result<Track> SongPageStore::getByPosition(quint64 position) const
{
    QMutexLocker lock(&m_mutex);
    auto it = m_tracks.constFind(position);
    if (it == m_tracks.constEnd())
        return Result<Track>::failure(ErrorCategory::NotFound,
                                      QStringLiteral("no track at position %1").arg(position));
    return Result<Track>::success(it.value());
}

Result<Track> SongPageStore::at(int ordinal) const
{
    QMutexLocker lock(&m_mutex);
    if (ordinal < 0 || ordinal >= m_tracks.size())
        return Result<Track>::failure(ErrorCategory::NotFound,
                                      QStringLiteral("no track at index %1 of %2")
                                          .arg(ordinal).arg(m_tracks.size()));
    return Result<Track>::success(std::next(m_tracks.constBegin(), ordinal).value());
}

QVector<Track> SongPageStore::page(quint64 offset) const
{
    QMutexLocker lock(&m_mutex);
    QVector<Track> result;
    const quint64 end = offset + kPageSize;
    for (auto it = m_tracks.lowerBound(offset); it != m_tracks.constEnd() && it.key() < end; ++it)
        result.append(it.value());
    return result;
}

bool SongPageStore::remove(quint64 position)
{
    QMutexLocker lock(&m_mutex);
    return m_tracks.remove(position) > 0;
}

int SongPageStore::length() const
{
    QMutexLocker lock(&m_mutex);
    return m_tracks.size();
}
