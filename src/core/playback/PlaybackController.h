#pragma once

#include <QMutex>
#include <QObject>
#include <QPointer>
#include <QSharedPointer>
#include <QThread>
#include <optional>

#include "../MusicData.h"
#include "../library/SongPageStore.h"
#include "PlaybackConfig.h"

class IMediaPlayer;
class HistoryStore;
class UserProfile;
class SessionToken;
class TimeObserver;
class EndOfTrackWatcher;
class ListeningTimeAccumulator;

// Owns the playback session: what is playing, in which mode, and where in
// the active playlist.  Commands the external player and keeps the session
// in step with it through the watchers on the polling thread.
//
// All mutating calls are made on the controller's own thread.  snapshot()
// may be called from anywhere.
class PlaybackController : public QObject {
    Q_OBJECT

public:
    enum class State { Idle, Loading, Playing, Error };
    Q_ENUM(State)

    enum class Direction { Next, Previous };
    Q_ENUM(Direction)

    struct NowPlaying {
        Track   track;
        double  currentTimeSeconds = 0.0;
        QString totalDuration = QStringLiteral("00:00");
        int     volume = 0;
        bool    paused = false;
    };

    struct Session {
        std::optional<Track>   currentTrack;
        State                  state = State::Idle;
        bool                   playlistMode = false;
        QSharedPointer<SongPageStore> activePlaylist;
        std::optional<quint64> currentIndex;   // ordinal in activePlaylist
        std::optional<NowPlaying> nowPlaying;
        quint64                generation = 0;
    };

    PlaybackController(IMediaPlayer* player, HistoryStore* history, UserProfile* profile,
                       const PlaybackConfig& config, QObject* parent = nullptr);
    ~PlaybackController() override;

    void start();
    void shutdown();
    bool isRunning() const { return m_pollThread.isRunning(); }

    // ── Session operations ───────────────────────────────────────────
    Result<void> playTrack(const Track& track, bool playlistMode = false);
    Result<void> playPlaylist(const QSharedPointer<SongPageStore>& playlist, quint64 startIndex = 0);
    Result<void> advance(Direction direction);
    void stopPlaylistMode();

    // ── Transport ────────────────────────────────────────────────────
    Result<void> togglePause();
    Result<void> seek(int seconds);
    Result<void> adjustVolume(int delta);

    // ── Queries ──────────────────────────────────────────────────────
    Session snapshot() const;
    State state() const;

signals:
    void nowPlayingChanged(bool playlistMode);
    void playlistSessionEnded();
    void stateChanged(PlaybackController::State state);
    void positionChanged(double seconds);
    void playbackError(const QString& message);
    void storageError(const QString& message);

private slots:
    void onPositionPolled(quint64 generation, double seconds);
    void onEndOfTrack(quint64 generation);
    void onPlaybackConfirmed(quint64 generation, const QString& duration);
    void onConfirmExpired(quint64 generation);

private:
    void setState(State newState);
    void enterError(const Error& error);
    void goIdle();
    void startConfirmer(quint64 generation);
    void cancelConfirmer();
    bool isCurrent(quint64 generation, const char* report) const;

    IMediaPlayer* m_player;
    HistoryStore* m_history;
    UserProfile*  m_profile;
    PlaybackConfig m_config;

    QThread m_pollThread;
    QPointer<TimeObserver> m_timeObserver;
    QPointer<EndOfTrackWatcher> m_endWatcher;
    QPointer<ListeningTimeAccumulator> m_listening;
    QSharedPointer<SessionToken> m_confirmToken;

    mutable QMutex m_mutex;
    Session m_session;
};
