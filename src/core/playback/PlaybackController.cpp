#include "PlaybackController.h"
#include "IMediaPlayer.h"
#include "PlayerWatchers.h"
#include "SessionToken.h"
#include "../UserProfile.h"
#include "../library/HistoryStore.h"

#include <QDebug>
#include <QMutexLocker>

PlaybackController::PlaybackController(IMediaPlayer* player, HistoryStore* history,
                                       UserProfile* profile, const PlaybackConfig& config,
                                       QObject* parent)
    : QObject(parent)
    , m_player(player)
    , m_history(history)
    , m_profile(profile)
    , m_config(config)
{
    m_pollThread.setObjectName(QStringLiteral("QuaverPlayerPoll"));
}

PlaybackController::~PlaybackController()
{
    shutdown();
}

// ═════════════════════════════════════════════════════════════════════
//  Watcher lifecycle
// ═════════════════════════════════════════════════════════════════════

void PlaybackController::start()
{
    if (m_pollThread.isRunning())
        return;

    auto* timeObserver = new TimeObserver(m_player, m_config.positionPollMs);
    auto* endWatcher = new EndOfTrackWatcher(m_player, m_config.endOfTrackPollMs,
                                             m_config.endOfTrackIdleThreshold);
    auto* listening = new ListeningTimeAccumulator(m_player, m_profile, m_config.listeningPollMs);

    const QList<PlayerWatcher*> watchers{ timeObserver, endWatcher, listening };
    for (auto* w : watchers) {
        w->moveToThread(&m_pollThread);
        connect(&m_pollThread, &QThread::finished, w, &QObject::deleteLater);
    }

    connect(timeObserver, &TimeObserver::positionPolled,
            this, &PlaybackController::onPositionPolled);
    connect(endWatcher, &EndOfTrackWatcher::endOfTrack,
            this, &PlaybackController::onEndOfTrack);

    m_timeObserver = timeObserver;
    m_endWatcher = endWatcher;
    m_listening = listening;

    m_pollThread.start();
    for (auto* w : watchers)
        QMetaObject::invokeMethod(w, &PlayerWatcher::start, Qt::QueuedConnection);

    qDebug() << "[Playback] Watchers started";
}

void PlaybackController::shutdown()
{
    cancelConfirmer();
    if (!m_pollThread.isRunning())
        return;

    const QList<QPointer<PlayerWatcher>> watchers{ m_timeObserver.data(), m_endWatcher.data(), m_listening.data() };
    for (const auto& w : watchers) {
        if (w)
            QMetaObject::invokeMethod(w.data(), &PlayerWatcher::stop, Qt::BlockingQueuedConnection);
    }

    m_pollThread.quit();
    m_pollThread.wait();

    m_timeObserver.clear();
    m_endWatcher.clear();
    m_listening.clear();
    qDebug() << "[Playback] Watchers stopped";
}

void PlaybackController::startConfirmer(quint64 generation)
{
    m_confirmToken = SessionToken::create();

    auto* confirmer = new PlayingStateConfirmer(m_player, m_confirmToken, generation,
                                                m_config.confirmInitialDelayMs,
                                                m_config.confirmPollMs,
                                                m_config.confirmIdleBudget);
    confirmer->moveToThread(&m_pollThread);
    connect(&m_pollThread, &QThread::finished, confirmer, &QObject::deleteLater);
    connect(confirmer, &PlayingStateConfirmer::confirmed,
            this, &PlaybackController::onPlaybackConfirmed);
    connect(confirmer, &PlayingStateConfirmer::expired,
            this, &PlaybackController::onConfirmExpired);

    QMetaObject::invokeMethod(confirmer, &PlayingStateConfirmer::start, Qt::QueuedConnection);
}

void PlaybackController::cancelConfirmer()
{
    if (m_confirmToken) {
        m_confirmToken->cancel();
        m_confirmToken.reset();
    }
}

// ═════════════════════════════════════════════════════════════════════
//  Session operations
// ═════════════════════════════════════════════════════════════════════

Result<void> PlaybackController::playTrack(const Track& track, bool playlistMode)
{
    if (!track.isValid())
        return Result<void>::failure(ErrorCategory::NotFound, QStringLiteral("track has no id"));
    if (QThread::currentThread() != thread())
        return Result<void>::failure(ErrorCategory::Concurrency,
                                     QStringLiteral("playTrack called off the controller thread"));

    if (!m_pollThread.isRunning())
        start();

    quint64 generation;
    bool endedPlaylist = false;
    {
        QMutexLocker lock(&m_mutex);
        generation = ++m_session.generation;
        if (!playlistMode && m_session.activePlaylist) {
            m_session.activePlaylist.reset();
            m_session.currentIndex.reset();
            endedPlaylist = true;
        }
        m_session.playlistMode = playlistMode;
    }
    if (endedPlaylist)
        emit playlistSessionEnded();

    // Latest request wins: stale watcher reports are dropped by generation
    cancelConfirmer();
    if (m_endWatcher)
        QMetaObject::invokeMethod(m_endWatcher.data(), &EndOfTrackWatcher::disarm, Qt::QueuedConnection);
    setState(State::Loading);

    qDebug() << "[Playback] Play request:" << track.id << track.title
             << "(generation" << generation << ", playlist" << playlistMode << ")";

    auto played = m_player->play(m_config.mediaUrlFor(track.id));
    if (!played.ok) {
        enterError(played.error);
        return played;
    }

    auto looped = m_player->setLoop(!playlistMode);
    if (!looped.ok) {
        enterError(looped.error);
        return looped;
    }

    {
        QMutexLocker lock(&m_mutex);
        m_session.currentTrack = track;
        m_session.nowPlaying.reset();
    }

    if (m_history) {
        auto recorded = m_history->recordPlay(track);
        if (!recorded.ok) {
            qWarning() << "[Playback] History write failed, playback continues:" << recorded.error;
            emit storageError(recorded.error.message);
        }
    }
    if (m_profile)
        m_profile->incrementSongsPlayed();

    emit nowPlayingChanged(playlistMode);

    startConfirmer(generation);
    if (m_endWatcher) {
        m_endWatcher->setPaused(false);
        QPointer<EndOfTrackWatcher> watcher = m_endWatcher;
        QMetaObject::invokeMethod(m_endWatcher.data(), [watcher, generation]() {
            if (watcher)
                watcher->arm(generation);
        }, Qt::QueuedConnection);
    }
    if (m_timeObserver)
        m_timeObserver->setGeneration(generation);

    return Result<void>::success();
}

Result<void> PlaybackController::playPlaylist(const QSharedPointer<SongPageStore>& playlist,
                                              quint64 startIndex)
{
    if (!playlist || playlist->isEmpty())
        return Result<void>::failure(ErrorCategory::NotFound, QStringLiteral("playlist is empty"));

    auto first = playlist->at(static_cast<int>(startIndex));
    if (!first.ok)
        return Result<void>::failure(first.error);

    {
        QMutexLocker lock(&m_mutex);
        m_session.activePlaylist = playlist;
        m_session.currentIndex = startIndex;
    }
    qDebug() << "[Playback] Playlist session started," << playlist->length()
             << "tracks, at" << startIndex;
    return playTrack(first.value, true);
}

Result<void> PlaybackController::advance(Direction direction)
{
    QSharedPointer<SongPageStore> playlist;
    quint64 index = 0;
    {
        QMutexLocker lock(&m_mutex);
        playlist = m_session.activePlaylist;
        index = m_session.currentIndex.value_or(0);
    }

    if (!playlist) {
        qDebug() << "[Playback] advance ignored: no active playlist";
        return Result<void>::success();
    }

    const quint64 length = static_cast<quint64>(playlist->length());
    if (length == 0)
        return Result<void>::success();

    quint64 target;
    if (direction == Direction::Next)
        target = (index + 1) % length;
    else
        target = index == 0 ? 0 : index - 1;

    auto track = playlist->at(static_cast<int>(target));
    if (!track.ok) {
        qWarning() << "[Playback] advance failed:" << track.error;
        return Result<void>::failure(track.error);
    }

    {
        QMutexLocker lock(&m_mutex);
        m_session.currentIndex = target;
    }
    return playTrack(track.value, true);
}

void PlaybackController::stopPlaylistMode()
{
    {
        QMutexLocker lock(&m_mutex);
        m_session.activePlaylist.reset();
        m_session.currentIndex.reset();
        m_session.playlistMode = false;
    }
    qDebug() << "[Playback] Playlist session ended";
    emit playlistSessionEnded();
}

// ═════════════════════════════════════════════════════════════════════
//  Transport
// ═════════════════════════════════════════════════════════════════════

Result<void> PlaybackController::togglePause()
{
    bool paused = false;
    {
        QMutexLocker lock(&m_mutex);
        // The confirmer would read a pause as a failed start
        if (m_session.state == State::Loading)
            return Result<void>::failure(ErrorCategory::Player,
                                         QStringLiteral("player is still loading"));
        if (m_session.nowPlaying)
            paused = !m_session.nowPlaying->paused;
    }

    // Silence the end-of-track watcher before the player stops reporting playing
    if (m_endWatcher && paused)
        m_endWatcher->setPaused(true);

    auto toggled = m_player->togglePause();
    if (!toggled.ok) {
        if (m_endWatcher)
            m_endWatcher->setPaused(false);
        enterError(toggled.error);
        return toggled;
    }

    {
        QMutexLocker lock(&m_mutex);
        if (m_session.nowPlaying)
            m_session.nowPlaying->paused = paused;
    }
    if (m_endWatcher && !paused)
        m_endWatcher->setPaused(false);
    return toggled;
}

Result<void> PlaybackController::seek(int seconds)
{
    auto sought = m_player->seek(seconds);
    if (!sought.ok)
        enterError(sought.error);
    return sought;
}

Result<void> PlaybackController::adjustVolume(int delta)
{
    auto adjusted = m_player->adjustVolume(delta);
    if (!adjusted.ok) {
        enterError(adjusted.error);
        return adjusted;
    }

    auto volume = m_player->currentVolume();
    if (volume.ok) {
        QMutexLocker lock(&m_mutex);
        if (m_session.nowPlaying)
            m_session.nowPlaying->volume = volume.value;
    }
    return adjusted;
}

// ═════════════════════════════════════════════════════════════════════
//  Queries
// ═════════════════════════════════════════════════════════════════════

PlaybackController::Session PlaybackController::snapshot() const
{
    QMutexLocker lock(&m_mutex);
    return m_session;
}

PlaybackController::State PlaybackController::state() const
{
    QMutexLocker lock(&m_mutex);
    return m_session.state;
}

// ═════════════════════════════════════════════════════════════════════
//  Watcher reports
// ═════════════════════════════════════════════════════════════════════

bool PlaybackController::isCurrent(quint64 generation, const char* report) const
{
    QMutexLocker lock(&m_mutex);
    if (generation == m_session.generation)
        return true;
    qDebug() << "[Playback] Dropping stale" << report << "for generation" << generation
             << "(current" << m_session.generation << ")";
    return false;
}

void PlaybackController::onPositionPolled(quint64 generation, double seconds)
{
    {
        QMutexLocker lock(&m_mutex);
        if (generation != m_session.generation || !m_session.nowPlaying)
            return;
        m_session.nowPlaying->currentTimeSeconds = seconds;
    }
    emit positionChanged(seconds);
}

void PlaybackController::onPlaybackConfirmed(quint64 generation, const QString& duration)
{
    if (!isCurrent(generation, "confirmation"))
        return;

    auto volume = m_player->currentVolume();
    {
        QMutexLocker lock(&m_mutex);
        if (m_session.state != State::Loading || !m_session.currentTrack) {
            qWarning() << "[Playback] Confirmation cannot be applied in state"
                       << static_cast<int>(m_session.state);
            return;
        }
        NowPlaying np;
        np.track = *m_session.currentTrack;
        np.totalDuration = duration;
        np.volume = volume.ok ? volume.value : 0;
        m_session.nowPlaying = np;
    }
    qDebug() << "[Playback] Playing confirmed, duration" << duration;
    setState(State::Playing);
}

void PlaybackController::onConfirmExpired(quint64 generation)
{
    if (!isCurrent(generation, "confirm timeout"))
        return;
    if (state() != State::Loading) {
        qWarning() << "[Playback] Confirm timeout cannot be applied in state"
                   << static_cast<int>(state());
        return;
    }
    qDebug() << "[Playback] Player did not start, going idle";
    goIdle();
}

void PlaybackController::onEndOfTrack(quint64 generation)
{
    if (!isCurrent(generation, "end of track"))
        return;

    bool advanceable;
    {
        QMutexLocker lock(&m_mutex);
        advanceable = m_session.playlistMode && m_session.activePlaylist;
    }

    if (advanceable) {
        auto next = advance(Direction::Next);
        if (!next.ok && next.error.category != ErrorCategory::Player) {
            qWarning() << "[Playback] Auto-advance failed, going idle:" << next.error;
            goIdle();
        }
        return;
    }
    goIdle();
}

// ═════════════════════════════════════════════════════════════════════
//  State helpers
// ═════════════════════════════════════════════════════════════════════

void PlaybackController::setState(State newState)
{
    {
        QMutexLocker lock(&m_mutex);
        if (m_session.state == newState)
            return;
        m_session.state = newState;
    }
    emit stateChanged(newState);
}

void PlaybackController::goIdle()
{
    {
        QMutexLocker lock(&m_mutex);
        m_session.nowPlaying.reset();
        m_session.currentTrack.reset();
    }
    setState(State::Idle);
}

void PlaybackController::enterError(const Error& error)
{
    qWarning() << "[Playback] Player command failed:" << error;
    cancelConfirmer();
    if (m_endWatcher)
        QMetaObject::invokeMethod(m_endWatcher.data(), &EndOfTrackWatcher::disarm, Qt::QueuedConnection);
    setState(State::Error);
    emit playbackError(error.message);
}
