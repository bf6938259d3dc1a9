#pragma once

#include <QAtomicInteger>
#include <QObject>
#include <QSharedPointer>
#include <QString>

class QTimer;
class IMediaPlayer;
class SessionToken;
class UserProfile;

// Base for the background tasks that poll the external player.
//
// Watchers are created on the controller thread, moved to the polling
// thread and started there through a queued call.  Reports leave through
// signals tagged with the session generation they were armed for.
class PlayerWatcher : public QObject {
    Q_OBJECT

public:
    PlayerWatcher(IMediaPlayer* player, int intervalMs, QObject* parent = nullptr);

    void setGeneration(quint64 generation) { m_generation.storeRelease(generation); }
    quint64 generation() const { return m_generation.loadAcquire(); }

public slots:
    virtual void start();
    void stop();

protected:
    virtual void poll() = 0;

    IMediaPlayer* m_player;
    QTimer* m_timer;

private:
    QAtomicInteger<quint64> m_generation{0};
};

// ── Time observer ───────────────────────────────────────────────────
// Reports the playback position; failed polls carry no information.
class TimeObserver : public PlayerWatcher {
    Q_OBJECT
public:
    using PlayerWatcher::PlayerWatcher;

signals:
    void positionPolled(quint64 generation, double seconds);

protected:
    void poll() override;
};

// ── End-of-track watcher ────────────────────────────────────────────
// Once armed, waits until the player has been seen playing, then reports
// end of track after `idleThreshold` consecutive non-playing polls.  Polls
// taken while the user has paused are ignored.  Fires at most once per arm.
class EndOfTrackWatcher : public PlayerWatcher {
    Q_OBJECT
public:
    EndOfTrackWatcher(IMediaPlayer* player, int intervalMs, int idleThreshold,
                      QObject* parent = nullptr);

    void setPaused(bool paused) { m_paused.storeRelease(paused ? 1 : 0); }

public slots:
    void arm(quint64 generation);
    void disarm();

signals:
    void endOfTrack(quint64 generation);

protected:
    void poll() override;

private:
    int m_idleThreshold;
    bool m_armed = false;
    bool m_wasPlaying = false;
    int m_idleCount = 0;
    QAtomicInt m_paused{0};
};

// ── Playing-state confirmer ─────────────────────────────────────────
// One per play request.  After an initial delay polls "is playing" until
// confirmed or the idle budget is spent, then deletes itself.
class PlayingStateConfirmer : public PlayerWatcher {
    Q_OBJECT
public:
    PlayingStateConfirmer(IMediaPlayer* player, QSharedPointer<SessionToken> token,
                          quint64 generation, int initialDelayMs, int intervalMs,
                          int idleBudget, QObject* parent = nullptr);

public slots:
    void start() override;

signals:
    void confirmed(quint64 generation, const QString& duration);
    void expired(quint64 generation);
    void finished();

protected:
    void poll() override;

private:
    void finish();

    QSharedPointer<SessionToken> m_token;
    int m_initialDelayMs;
    int m_intervalMs;
    int m_idleBudget;
    int m_polls = 0;
    bool m_done = false;
};

// ── Listening-time accumulator ──────────────────────────────────────
// Adds one second to the profile for each poll that finds the player playing.
class ListeningTimeAccumulator : public PlayerWatcher {
    Q_OBJECT
public:
    ListeningTimeAccumulator(IMediaPlayer* player, UserProfile* profile, int intervalMs,
                             QObject* parent = nullptr);

protected:
    void poll() override;

private:
    UserProfile* m_profile;
};
