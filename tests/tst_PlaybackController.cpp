#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTemporaryDir>
#include "FakeMediaPlayer.h"
#include "UserProfile.h"
#include "library/HistoryStore.h"
#include "library/SongPageStore.h"
#include "playback/PlaybackController.h"

using State = PlaybackController::State;
using Direction = PlaybackController::Direction;

static Track makeTrack(const QString& id)
{
    Track t;
    t.id = id;
    t.title = QStringLiteral("Song ") + id.toUpper();
    t.artists = {QStringLiteral("Band")};
    return t;
}

static PlaybackConfig fastConfig()
{
    PlaybackConfig c;
    c.positionPollMs = 20;
    c.endOfTrackPollMs = 20;
    c.endOfTrackIdleThreshold = 3;
    c.confirmInitialDelayMs = 10;
    c.confirmPollMs = 20;
    c.confirmIdleBudget = 5;
    c.listeningPollMs = 20;
    c.mediaUrlTemplate = QStringLiteral("https://media.test/watch?v=%1");
    return c;
}

static QSharedPointer<SongPageStore> threeTracks()
{
    return SongPageStore::fromTracks({makeTrack(QStringLiteral("a")),
                                      makeTrack(QStringLiteral("b")),
                                      makeTrack(QStringLiteral("c"))});
}

class tst_PlaybackController : public QObject {
    Q_OBJECT

private:
    QTemporaryDir m_dir;
    int m_run = 0;
    FakeMediaPlayer* m_player = nullptr;
    HistoryStore* m_history = nullptr;
    UserProfile* m_profile = nullptr;
    PlaybackController* m_controller = nullptr;

private slots:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
        QVERIFY(m_dir.isValid());
    }

    void init()
    {
        m_player = new FakeMediaPlayer;
        m_history = new HistoryStore(m_dir.filePath(QStringLiteral("history_%1.db").arg(++m_run)));
        QVERIFY(m_history->open().ok);
        m_profile = new UserProfile(m_history);
        m_controller = new PlaybackController(m_player, m_history, m_profile, fastConfig());
        m_controller->start();
    }

    void cleanup()
    {
        delete m_controller;
        delete m_profile;
        delete m_history;
        delete m_player;
        m_controller = nullptr;
        m_profile = nullptr;
        m_history = nullptr;
        m_player = nullptr;
    }

    // ── Idle → Loading → Playing ─────────────────────────────────
    void playTrack_idleLoadingPlaying()
    {
        m_player->setAutoPlay(false);
        QSignalSpy stateSpy(m_controller, &PlaybackController::stateChanged);
        QSignalSpy nowPlayingSpy(m_controller, &PlaybackController::nowPlayingChanged);

        QCOMPARE(m_controller->state(), State::Idle);
        QVERIFY(m_controller->playTrack(makeTrack(QStringLiteral("a"))).ok);

        QCOMPARE(m_controller->state(), State::Loading);
        QCOMPARE(stateSpy.count(), 1);
        QCOMPARE(stateSpy.at(0).at(0).value<State>(), State::Loading);
        QCOMPARE(nowPlayingSpy.count(), 1);
        QCOMPARE(nowPlayingSpy.at(0).at(0).toBool(), false);

        m_player->setPlaying(true);
        QTRY_COMPARE(m_controller->state(), State::Playing);
        QCOMPARE(stateSpy.last().at(0).value<State>(), State::Playing);

        auto top = m_history->mostPlayed(1);
        QVERIFY(top.ok);
        QCOMPARE(top.value.size(), 1);
        QCOMPARE(top.value.first().track.id, QStringLiteral("a"));
        QCOMPARE(top.value.first().playCount, quint32(1));

        const auto session = m_controller->snapshot();
        QVERIFY(session.nowPlaying.has_value());
        QCOMPARE(session.nowPlaying->track.id, QStringLiteral("a"));
        QCOMPARE(session.nowPlaying->totalDuration, QStringLiteral("03:25"));
        QCOMPARE(session.nowPlaying->volume, 50);
    }

    void playTrack_singleMode_resolvesUrlAndLoops()
    {
        QVERIFY(m_controller->playTrack(makeTrack(QStringLiteral("xyz"))).ok);
        QCOMPARE(m_player->urls(), QStringList{QStringLiteral("https://media.test/watch?v=xyz")});
        QCOMPARE(m_player->loops(), QList<bool>{true});
        QCOMPARE(m_profile->songsPlayed() > 0, true);
    }

    void playTrack_confirmBudgetSpent_goesIdle()
    {
        m_player->setAutoPlay(false);
        QVERIFY(m_controller->playTrack(makeTrack(QStringLiteral("a"))).ok);
        QCOMPARE(m_controller->state(), State::Loading);

        QTRY_COMPARE(m_controller->state(), State::Idle);
        QVERIFY(!m_controller->snapshot().nowPlaying.has_value());
    }

    void playTrack_playerFailure_entersError()
    {
        m_player->setFailPlay(true);
        QSignalSpy errorSpy(m_controller, &PlaybackController::playbackError);

        auto r = m_controller->playTrack(makeTrack(QStringLiteral("a")));
        QVERIFY(!r.ok);
        QCOMPARE(r.error.category, ErrorCategory::Player);
        QCOMPARE(m_controller->state(), State::Error);
        QCOMPARE(errorSpy.count(), 1);
        QCOMPARE(m_history->count().value, qint64(0));
    }

    void playTrack_historyFailure_playbackContinues()
    {
        m_history->close();
        QSignalSpy storageSpy(m_controller, &PlaybackController::storageError);

        QVERIFY(m_controller->playTrack(makeTrack(QStringLiteral("a"))).ok);
        QCOMPARE(storageSpy.count(), 1);
        QVERIFY(m_controller->state() != State::Error);
        QTRY_COMPARE(m_controller->state(), State::Playing);
    }

    // ── Latest request wins ──────────────────────────────────────
    void playTrack_whileLoading_latestWins()
    {
        m_player->setAutoPlay(false);
        QVERIFY(m_controller->playTrack(makeTrack(QStringLiteral("a"))).ok);
        QVERIFY(m_controller->playTrack(makeTrack(QStringLiteral("b"))).ok);
        QCOMPARE(m_controller->state(), State::Loading);

        m_player->setPlaying(true);
        QTRY_COMPARE(m_controller->state(), State::Playing);

        const auto session = m_controller->snapshot();
        QCOMPARE(session.currentTrack->id, QStringLiteral("b"));
        QCOMPARE(session.nowPlaying->track.id, QStringLiteral("b"));
        QCOMPARE(session.generation, quint64(2));
    }

    // ── Playlist traversal laws ──────────────────────────────────
    void advance_next_wrapsAround()
    {
        auto playlist = threeTracks();
        QVERIFY(m_controller->playPlaylist(playlist, 2).ok);
        QCOMPARE(*m_controller->snapshot().currentIndex, quint64(2));
        QCOMPARE(m_player->loops().last(), false);

        QVERIFY(m_controller->advance(Direction::Next).ok);
        QCOMPARE(*m_controller->snapshot().currentIndex, quint64(0));
        QCOMPARE(m_player->urls().last(), QStringLiteral("https://media.test/watch?v=a"));

        QVERIFY(m_controller->advance(Direction::Next).ok);
        QCOMPARE(*m_controller->snapshot().currentIndex, quint64(1));
    }

    void advance_next_fullCycle_returnsToStart()
    {
        auto playlist = threeTracks();
        QVERIFY(m_controller->playPlaylist(playlist, 1).ok);

        for (int i = 0; i < playlist->length(); ++i)
            QVERIFY(m_controller->advance(Direction::Next).ok);

        QCOMPARE(*m_controller->snapshot().currentIndex, quint64(1));
        QCOMPARE(m_player->urls().last(), QStringLiteral("https://media.test/watch?v=b"));
        QCOMPARE(m_player->urls().size(), 4);
    }

    void advance_previous_clampsAtZero()
    {
        auto playlist = threeTracks();
        QVERIFY(m_controller->playPlaylist(playlist, 1).ok);

        QVERIFY(m_controller->advance(Direction::Previous).ok);
        QCOMPARE(*m_controller->snapshot().currentIndex, quint64(0));

        QVERIFY(m_controller->advance(Direction::Previous).ok);
        QCOMPARE(*m_controller->snapshot().currentIndex, quint64(0));
        QCOMPARE(m_player->urls().last(), QStringLiteral("https://media.test/watch?v=a"));
    }

    void advance_withoutPlaylist_isNoop()
    {
        QVERIFY(m_controller->advance(Direction::Next).ok);
        QVERIFY(m_player->urls().isEmpty());
        QCOMPARE(m_controller->state(), State::Idle);
    }

    void playPlaylist_empty_notFound()
    {
        auto r = m_controller->playPlaylist(QSharedPointer<SongPageStore>::create(), 0);
        QVERIFY(!r.ok);
        QCOMPARE(r.error.category, ErrorCategory::NotFound);
        QVERIFY(m_player->urls().isEmpty());
    }

    void stopPlaylistMode_clearsAndSignals()
    {
        QVERIFY(m_controller->playPlaylist(threeTracks(), 0).ok);
        QSignalSpy endedSpy(m_controller, &PlaybackController::playlistSessionEnded);

        m_controller->stopPlaylistMode();
        QCOMPARE(endedSpy.count(), 1);

        const auto session = m_controller->snapshot();
        QVERIFY(!session.playlistMode);
        QVERIFY(session.activePlaylist.isNull());
        QVERIFY(!session.currentIndex.has_value());

        const int plays = m_player->urls().size();
        QVERIFY(m_controller->advance(Direction::Next).ok);
        QCOMPARE(m_player->urls().size(), plays);
    }

    // ── End of track ─────────────────────────────────────────────
    void endOfTrack_inPlaylist_autoAdvances()
    {
        QSignalSpy nowPlayingSpy(m_controller, &PlaybackController::nowPlayingChanged);
        QVERIFY(m_controller->playPlaylist(threeTracks(), 0).ok);
        QTRY_COMPARE(m_controller->state(), State::Playing);
        QTRY_VERIFY(m_player->isPlayingCalls() >= 6);

        m_player->setPlaying(false);

        QTRY_COMPARE(m_player->urls().size(), 2);
        QCOMPARE(m_player->urls().last(), QStringLiteral("https://media.test/watch?v=b"));
        QCOMPARE(*m_controller->snapshot().currentIndex, quint64(1));
        QCOMPARE(nowPlayingSpy.last().at(0).toBool(), true);
        QTRY_COMPARE(m_controller->state(), State::Playing);
    }

    void endOfTrack_gappedPlaylist_skipsEmptyPosition()
    {
        auto playlist = SongPageStore::fromTracks({makeTrack(QStringLiteral("a")),
                                                   makeTrack(QStringLiteral("b")),
                                                   makeTrack(QStringLiteral("c")),
                                                   makeTrack(QStringLiteral("d"))});
        QVERIFY(playlist->remove(2));

        QVERIFY(m_controller->playPlaylist(playlist, 1).ok);
        QTRY_COMPARE(m_controller->state(), State::Playing);
        QTRY_VERIFY(m_player->isPlayingCalls() >= 6);

        m_player->setPlaying(false);

        QTRY_COMPARE(m_player->urls().size(), 2);
        QCOMPARE(m_player->urls().last(), QStringLiteral("https://media.test/watch?v=d"));
        QCOMPARE(*m_controller->snapshot().currentIndex, quint64(2));
        QCOMPARE(m_controller->snapshot().currentTrack->id, QStringLiteral("d"));
        QTRY_COMPARE(m_controller->state(), State::Playing);

        QVERIFY(m_controller->advance(Direction::Next).ok);
        QCOMPARE(m_player->urls().last(), QStringLiteral("https://media.test/watch?v=a"));
    }

    void endOfTrack_singleTrack_goesIdle()
    {
        QVERIFY(m_controller->playTrack(makeTrack(QStringLiteral("a"))).ok);
        QTRY_COMPARE(m_controller->state(), State::Playing);
        QTRY_VERIFY(m_player->isPlayingCalls() >= 6);

        m_player->setPlaying(false);
        QTRY_COMPARE(m_controller->state(), State::Idle);
        QCOMPARE(m_player->urls().size(), 1);
        QVERIFY(!m_controller->snapshot().currentTrack.has_value());
    }

    void endOfTrack_ignoredWhilePaused()
    {
        QVERIFY(m_controller->playTrack(makeTrack(QStringLiteral("a"))).ok);
        QTRY_COMPARE(m_controller->state(), State::Playing);
        QTRY_VERIFY(m_player->isPlayingCalls() >= 6);

        QVERIFY(m_controller->togglePause().ok);
        QVERIFY(m_controller->snapshot().nowPlaying->paused);
        QTest::qWait(200);
        QCOMPARE(m_controller->state(), State::Playing);

        QVERIFY(m_controller->togglePause().ok);
        QVERIFY(!m_controller->snapshot().nowPlaying->paused);
    }

    // ── Transport and observers ──────────────────────────────────
    void togglePause_whileLoading_refused()
    {
        m_player->setAutoPlay(false);
        QVERIFY(m_controller->playTrack(makeTrack(QStringLiteral("a"))).ok);
        QSignalSpy errorSpy(m_controller, &PlaybackController::playbackError);

        auto r = m_controller->togglePause();
        QVERIFY(!r.ok);
        QVERIFY(!m_player->paused());
        QCOMPARE(m_controller->state(), State::Loading);
        QCOMPARE(errorSpy.count(), 0);

        m_player->setPlaying(true);
        QTRY_COMPARE(m_controller->state(), State::Playing);
        QVERIFY(m_controller->togglePause().ok);
        QVERIFY(m_player->paused());
        QVERIFY(m_controller->snapshot().nowPlaying->paused);
        QCOMPARE(m_controller->snapshot().currentTrack->id, QStringLiteral("a"));
    }

    void adjustVolume_updatesNowPlaying()
    {
        QVERIFY(m_controller->playTrack(makeTrack(QStringLiteral("a"))).ok);
        QTRY_COMPARE(m_controller->state(), State::Playing);

        QVERIFY(m_controller->adjustVolume(5).ok);
        QCOMPARE(m_player->volume(), 55);
        QCOMPARE(m_controller->snapshot().nowPlaying->volume, 55);
    }

    void positionPolls_updateNowPlaying()
    {
        QSignalSpy positionSpy(m_controller, &PlaybackController::positionChanged);
        QVERIFY(m_controller->playTrack(makeTrack(QStringLiteral("a"))).ok);
        QTRY_COMPARE(m_controller->state(), State::Playing);

        QVERIFY(m_controller->seek(42).ok);
        QTRY_COMPARE(m_controller->snapshot().nowPlaying->currentTimeSeconds, 42.0);
        QVERIFY(positionSpy.count() >= 1);
    }

    void listeningTime_accumulatesWhilePlaying()
    {
        const qint64 before = m_profile->listenedSeconds();
        QVERIFY(m_controller->playTrack(makeTrack(QStringLiteral("a"))).ok);
        QTRY_VERIFY(m_profile->listenedSeconds() >= before + 2);
    }

    void playTrack_offControllerThread_rejected()
    {
        Result<void> r;
        QThread* worker = QThread::create([this, &r]() {
            r = m_controller->playTrack(makeTrack(QStringLiteral("a")));
        });
        worker->start();
        QVERIFY(worker->wait(5000));
        delete worker;

        QVERIFY(!r.ok);
        QCOMPARE(r.error.category, ErrorCategory::Concurrency);
        QVERIFY(m_player->urls().isEmpty());
    }

    void shutdown_isIdempotent()
    {
        QVERIFY(m_controller->isRunning());
        m_controller->shutdown();
        QVERIFY(!m_controller->isRunning());
        m_controller->shutdown();
        QVERIFY(!m_controller->isRunning());
    }
};

QTEST_MAIN(tst_PlaybackController)
#include "tst_PlaybackController.moc"
