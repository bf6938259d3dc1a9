#ifndef MUSICDATA_H
#define MUSICDATA_H

#include <QString>
#include <QStringList>
#include <QVector>
#include <QJsonObject>
#include <QMetaType>

#include "Result.h"

// ── Data Structs ────────────────────────────────────────────────────
struct Track {
    QString     id;
    QString     title;
    QStringList artists;

    bool isValid() const { return !id.isEmpty(); }
    QString artistLine() const { return artists.join(QStringLiteral(", ")); }

    // Identity is the id alone; title/artists are display metadata.
    bool operator==(const Track& other) const { return id == other.id; }
    bool operator!=(const Track& other) const { return id != other.id; }
};

struct HistoryEntry {
    Track   track;
    qint64  lastPlayedAt = 0;   // unix seconds
    quint32 playCount = 1;
};

struct PlaylistEntry {
    quint64 index = 0;
    Track   track;
};

struct Playlist {
    QString name;
    quint64 nextIndex = 0;
    QVector<PlaylistEntry> entries;   // storage order, not playback order

    QVector<Track> tracksInOrder() const;
};

Q_DECLARE_METATYPE(Track)

// ── Record codec ────────────────────────────────────────────────────
// Persisted values are compact JSON objects with a "v" schema version.
namespace Records {

constexpr int kHistoryVersion  = 2;
constexpr int kPlaylistVersion = 1;

QJsonObject trackToJson(const Track& track);
Result<Track> trackFromJson(const QJsonObject& obj);

QByteArray encodeHistoryEntry(const HistoryEntry& entry);
Result<HistoryEntry> decodeHistoryEntry(const QByteArray& bytes);

// Pre-play-count history layout: {song_name, song_id, artist_name, time_stamp}
bool isLegacyHistoryRecord(const QByteArray& bytes);
Result<HistoryEntry> decodeLegacyHistoryEntry(const QByteArray& bytes);

QByteArray encodePlaylist(const Playlist& playlist);
Result<Playlist> decodePlaylist(const QByteArray& bytes);

} // namespace Records

QString formatDuration(qint64 seconds);   // "MM:SS"

#endif // MUSICDATA_H
