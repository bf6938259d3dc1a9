#pragma once

#include <QFuture>
#include <QMutex>
#include <QObject>
#include <QString>
#include <optional>

#include "MusicData.h"

class QTimer;
class HistoryStore;

// Listening statistics for the local user.
//
// Counters may be bumped from any thread; persistence to Settings is
// debounced on the owning thread and written asynchronously.
class UserProfile : public QObject {
    Q_OBJECT
public:
    explicit UserProfile(HistoryStore* history = nullptr, QObject* parent = nullptr);
    ~UserProfile() override;

    QString name() const;
    qint64 listenedSeconds() const;
    qint64 songsPlayed() const;
    std::optional<HistoryEntry> lastPlayed() const;

    void addListenedSeconds(qint64 seconds);
    void incrementSongsPlayed();

    void load();
    void scheduleSave();
    void flush();

signals:
    void statsChanged();

private:
    void doSave();

    HistoryStore* m_history;
    QTimer* m_saveTimer;
    QFuture<void> m_pendingSave;

    mutable QMutex m_mutex;
    QString m_name;
    qint64 m_listenedSeconds = 0;
    qint64 m_songsPlayed = 0;
};
