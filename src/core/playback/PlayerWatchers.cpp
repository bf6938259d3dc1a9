#include "PlayerWatchers.h"
#include "IMediaPlayer.h"
#include "SessionToken.h"
#include "../UserProfile.h"

#include <QDebug>
#include <QTimer>

// ═════════════════════════════════════════════════════════════════════
//  PlayerWatcher
// ═════════════════════════════════════════════════════════════════════

PlayerWatcher::PlayerWatcher(IMediaPlayer* player, int intervalMs, QObject* parent)
    : QObject(parent)
    , m_player(player)
{
    // Child of the watcher so moveToThread() carries it along
    m_timer = new QTimer(this);
    m_timer->setInterval(intervalMs);
    connect(m_timer, &QTimer::timeout, this, &PlayerWatcher::poll);
}

void PlayerWatcher::start()
{
    m_timer->start();
}

void PlayerWatcher::stop()
{
    m_timer->stop();
}

// ═════════════════════════════════════════════════════════════════════
//  TimeObserver
// ═════════════════════════════════════════════════════════════════════

void TimeObserver::poll()
{
    auto pos = m_player->position();
    if (!pos.ok)
        return;
    emit positionPolled(generation(), pos.value);
}

// ═════════════════════════════════════════════════════════════════════
//  EndOfTrackWatcher
// ═════════════════════════════════════════════════════════════════════

EndOfTrackWatcher::EndOfTrackWatcher(IMediaPlayer* player, int intervalMs, int idleThreshold,
                                     QObject* parent)
    : PlayerWatcher(player, intervalMs, parent)
    , m_idleThreshold(idleThreshold)
{
}

void EndOfTrackWatcher::arm(quint64 generation)
{
    setGeneration(generation);
    m_armed = true;
    m_wasPlaying = false;
    m_idleCount = 0;
}

void EndOfTrackWatcher::disarm()
{
    m_armed = false;
}

void EndOfTrackWatcher::poll()
{
    if (!m_armed || m_paused.loadAcquire())
        return;

    auto playing = m_player->isPlaying();
    if (!playing.ok)
        return;

    if (playing.value) {
        m_wasPlaying = true;
        m_idleCount = 0;
        return;
    }

    // Loading gaps before the first "playing" observation never count
    if (!m_wasPlaying)
        return;

    if (++m_idleCount >= m_idleThreshold) {
        m_armed = false;
        qDebug() << "[Playback] End of track detected, generation" << generation();
        emit endOfTrack(generation());
    }
}

// ═════════════════════════════════════════════════════════════════════
//  PlayingStateConfirmer
// ═════════════════════════════════════════════════════════════════════

PlayingStateConfirmer::PlayingStateConfirmer(IMediaPlayer* player, QSharedPointer<SessionToken> token,
                                             quint64 generation, int initialDelayMs, int intervalMs,
                                             int idleBudget, QObject* parent)
    : PlayerWatcher(player, intervalMs, parent)
    , m_token(std::move(token))
    , m_initialDelayMs(initialDelayMs)
    , m_intervalMs(intervalMs)
    , m_idleBudget(idleBudget)
{
    setGeneration(generation);
    connect(m_token.data(), &SessionToken::cancelled, this, &PlayingStateConfirmer::finish);
}

void PlayingStateConfirmer::start()
{
    if (m_token->isCancelled()) {
        finish();
        return;
    }
    m_timer->start(m_initialDelayMs);
}

void PlayingStateConfirmer::poll()
{
    if (m_done)
        return;
    if (m_token->isCancelled()) {
        finish();
        return;
    }

    // First tick ends the initial delay
    if (m_timer->interval() != m_intervalMs)
        m_timer->setInterval(m_intervalMs);

    auto playing = m_player->isPlaying();
    if (playing.ok && playing.value) {
        const QString duration = m_player->duration();
        if (!m_token->isCancelled())
            emit confirmed(generation(), duration);
        finish();
        return;
    }

    if (++m_polls >= m_idleBudget) {
        qDebug() << "[Playback] Player never reported playing after" << m_polls
                 << "polls, generation" << generation();
        if (!m_token->isCancelled())
            emit expired(generation());
        finish();
    }
}

void PlayingStateConfirmer::finish()
{
    if (m_done)
        return;
    m_done = true;
    m_timer->stop();
    emit finished();
    deleteLater();
}

// ═════════════════════════════════════════════════════════════════════
//  ListeningTimeAccumulator
// ═════════════════════════════════════════════════════════════════════

ListeningTimeAccumulator::ListeningTimeAccumulator(IMediaPlayer* player, UserProfile* profile,
                                                   int intervalMs, QObject* parent)
    : PlayerWatcher(player, intervalMs, parent)
    , m_profile(profile)
{
}

void ListeningTimeAccumulator::poll()
{
    if (!m_profile)
        return;

    auto playing = m_player->isPlaying();
    if (playing.ok && playing.value)
        m_profile->addListenedSeconds(1);
}
