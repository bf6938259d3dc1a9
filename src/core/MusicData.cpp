#include "MusicData.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <algorithm>

// ── Playlist ────────────────────────────────────────────────────────
QVector<Track> Playlist::tracksInOrder() const
{
    QVector<PlaylistEntry> sorted = entries;
    std::sort(sorted.begin(), sorted.end(),
              [](const PlaylistEntry& a, const PlaylistEntry& b) { return a.index < b.index; });

    QVector<Track> result;
    result.reserve(sorted.size());
    for (const auto& e : sorted)
        result.append(e.track);
    return result;
}

QString formatDuration(qint64 seconds)
{
    if (seconds < 0) seconds = 0;
    return QStringLiteral("%1:%2")
        .arg(seconds / 60, 2, 10, QLatin1Char('0'))
        .arg(seconds % 60, 2, 10, QLatin1Char('0'));
}

namespace Records {

static Result<QJsonObject> parseObject(const QByteArray& bytes)
{
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(bytes, &err);
    if (err.error != QJsonParseError::NoError)
        return Result<QJsonObject>::failure(ErrorCategory::Serialization, err.errorString());
    if (!doc.isObject())
        return Result<QJsonObject>::failure(ErrorCategory::Serialization,
                                            QStringLiteral("record is not a JSON object"));
    return Result<QJsonObject>::success(doc.object());
}

static QStringList stringList(const QJsonValue& value)
{
    QStringList out;
    const QJsonArray arr = value.toArray();
    for (const auto& v : arr)
        out.append(v.toString());
    return out;
}

// ── Track ───────────────────────────────────────────────────────────
QJsonObject trackToJson(const Track& track)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), track.id);
    obj.insert(QStringLiteral("title"), track.title);
    obj.insert(QStringLiteral("artists"), QJsonArray::fromStringList(track.artists));
    return obj;
}

Result<Track> trackFromJson(const QJsonObject& obj)
{
    Track t;
    t.id      = obj.value(QStringLiteral("id")).toString();
    t.title   = obj.value(QStringLiteral("title")).toString();
    t.artists = stringList(obj.value(QStringLiteral("artists")));
    if (t.id.isEmpty())
        return Result<Track>::failure(ErrorCategory::Serialization,
                                      QStringLiteral("track record without id"));
    return Result<Track>::success(t);
}

// ── History ─────────────────────────────────────────────────────────
QByteArray encodeHistoryEntry(const HistoryEntry& entry)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("v"), kHistoryVersion);
    obj.insert(QStringLiteral("track"), trackToJson(entry.track));
    obj.insert(QStringLiteral("lastPlayedAt"), entry.lastPlayedAt);
    obj.insert(QStringLiteral("playCount"), static_cast<qint64>(entry.playCount));
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

Result<HistoryEntry> decodeHistoryEntry(const QByteArray& bytes)
{
    auto parsed = parseObject(bytes);
    if (!parsed.ok)
        return Result<HistoryEntry>::failure(parsed.error);

    const QJsonObject& obj = parsed.value;
    int version = obj.value(QStringLiteral("v")).toInt(0);
    if (version != kHistoryVersion)
        return Result<HistoryEntry>::failure(ErrorCategory::Serialization,
            QStringLiteral("unsupported history record version %1").arg(version));

    auto track = trackFromJson(obj.value(QStringLiteral("track")).toObject());
    if (!track.ok)
        return Result<HistoryEntry>::failure(track.error);

    HistoryEntry e;
    e.track        = track.value;
    e.lastPlayedAt = obj.value(QStringLiteral("lastPlayedAt")).toInteger();
    qint64 count   = obj.value(QStringLiteral("playCount")).toInteger();
    if (count < 1)
        return Result<HistoryEntry>::failure(ErrorCategory::Serialization,
            QStringLiteral("history record for %1 has play count %2").arg(e.track.id).arg(count));
    e.playCount = static_cast<quint32>(count);
    return Result<HistoryEntry>::success(e);
}

bool isLegacyHistoryRecord(const QByteArray& bytes)
{
    auto parsed = parseObject(bytes);
    return parsed.ok
        && !parsed.value.contains(QStringLiteral("v"))
        && parsed.value.contains(QStringLiteral("song_id"));
}

Result<HistoryEntry> decodeLegacyHistoryEntry(const QByteArray& bytes)
{
    auto parsed = parseObject(bytes);
    if (!parsed.ok)
        return Result<HistoryEntry>::failure(parsed.error);

    const QJsonObject& obj = parsed.value;
    HistoryEntry e;
    e.track.id      = obj.value(QStringLiteral("song_id")).toString();
    e.track.title   = obj.value(QStringLiteral("song_name")).toString();
    e.track.artists = stringList(obj.value(QStringLiteral("artist_name")));
    e.lastPlayedAt  = obj.value(QStringLiteral("time_stamp")).toInteger();
    e.playCount     = 1;
    if (e.track.id.isEmpty())
        return Result<HistoryEntry>::failure(ErrorCategory::Serialization,
                                             QStringLiteral("legacy history record without song_id"));
    return Result<HistoryEntry>::success(e);
}

// ── Playlist ────────────────────────────────────────────────────────
QByteArray encodePlaylist(const Playlist& playlist)
{
    QJsonArray entries;
    for (const auto& e : playlist.entries) {
        QJsonObject entry;
        entry.insert(QStringLiteral("index"), static_cast<qint64>(e.index));
        entry.insert(QStringLiteral("track"), trackToJson(e.track));
        entries.append(entry);
    }

    QJsonObject obj;
    obj.insert(QStringLiteral("v"), kPlaylistVersion);
    obj.insert(QStringLiteral("name"), playlist.name);
    obj.insert(QStringLiteral("nextIndex"), static_cast<qint64>(playlist.nextIndex));
    obj.insert(QStringLiteral("entries"), entries);
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

Result<Playlist> decodePlaylist(const QByteArray& bytes)
{
    auto parsed = parseObject(bytes);
    if (!parsed.ok)
        return Result<Playlist>::failure(parsed.error);

    const QJsonObject& obj = parsed.value;
    int version = obj.value(QStringLiteral("v")).toInt(0);
    if (version != kPlaylistVersion)
        return Result<Playlist>::failure(ErrorCategory::Serialization,
            QStringLiteral("unsupported playlist record version %1").arg(version));

    Playlist p;
    p.name      = obj.value(QStringLiteral("name")).toString();
    p.nextIndex = static_cast<quint64>(obj.value(QStringLiteral("nextIndex")).toInteger());

    const QJsonArray entries = obj.value(QStringLiteral("entries")).toArray();
    p.entries.reserve(entries.size());
    for (const auto& v : entries) {
        const QJsonObject entry = v.toObject();
        auto track = trackFromJson(entry.value(QStringLiteral("track")).toObject());
        if (!track.ok)
            return Result<Playlist>::failure(track.error);
        PlaylistEntry pe;
        pe.index = static_cast<quint64>(entry.value(QStringLiteral("index")).toInteger());
        pe.track = track.value;
        if (pe.index >= p.nextIndex)
            p.nextIndex = pe.index + 1;   // keep next_index ahead of every stored slot
        p.entries.append(pe);
    }
    return Result<Playlist>::success(p);
}

} // namespace Records
