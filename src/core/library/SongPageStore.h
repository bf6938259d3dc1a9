#pragma once

#include <QMap>
#include <QMutex>
#include <QSharedPointer>
#include <QVector>

#include "../MusicData.h"

// Session-local, position-keyed page cache.
//
// Built from an ordered list of tracks for one browse action and discarded
// on the next.  Positions are zero-based; page() tolerates gaps.
class SongPageStore {
public:
    static constexpr int kPageSize = 20;

    SongPageStore() = default;
    static QSharedPointer<SongPageStore> fromTracks(const QVector<Track>& tracks);

    SongPageStore(const SongPageStore&) = delete;
    SongPageStore& operator=(const SongPageStore&) = delete;

    quint64 append(const Track& track);   // returns the assigned position
    Result<Track> getByPosition(quint64 position) const;
    Result<Track> at(int ordinal) const;  // n-th occupied position, gaps skipped
    QVector<Track> page(quint64 offset) const;
    bool remove(quint64 position);
    int length() const;
    bool isEmpty() const { return length() == 0; }

private:
    QMap<quint64, Track> m_tracks;
    quint64 m_nextPosition = 0;
    mutable QMutex m_mutex;
};
