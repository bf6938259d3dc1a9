#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QStandardPaths>
#include "FakeMediaPlayer.h"
#include "UserProfile.h"
#include "playback/PlayerWatchers.h"
#include "playback/SessionToken.h"

class tst_PlayerWatchers : public QObject {
    Q_OBJECT

private slots:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
    }

    // ── TimeObserver ─────────────────────────────────────────────
    void timeObserver_reportsPositionWithGeneration()
    {
        FakeMediaPlayer player;
        player.setPosition(12.5);

        TimeObserver observer(&player, 10);
        observer.setGeneration(7);
        QSignalSpy spy(&observer, &TimeObserver::positionPolled);
        observer.start();

        QTRY_VERIFY(spy.count() >= 1);
        QCOMPARE(spy.at(0).at(0).value<quint64>(), quint64(7));
        QCOMPARE(spy.at(0).at(1).toDouble(), 12.5);
        observer.stop();
    }

    // ── EndOfTrackWatcher ────────────────────────────────────────
    void endOfTrack_notArmed_staysQuiet()
    {
        FakeMediaPlayer player;
        EndOfTrackWatcher watcher(&player, 10, 2);
        QSignalSpy spy(&watcher, &EndOfTrackWatcher::endOfTrack);
        watcher.start();

        QTest::qWait(100);
        QCOMPARE(spy.count(), 0);
    }

    void endOfTrack_requiresPlayingFirst()
    {
        FakeMediaPlayer player;   // never playing
        EndOfTrackWatcher watcher(&player, 10, 2);
        QSignalSpy spy(&watcher, &EndOfTrackWatcher::endOfTrack);
        watcher.arm(1);
        watcher.start();

        QTRY_VERIFY(player.isPlayingCalls() >= 6);
        QCOMPARE(spy.count(), 0);
    }

    void endOfTrack_firesOnceAfterThreshold()
    {
        FakeMediaPlayer player;
        player.setPlaying(true);

        EndOfTrackWatcher watcher(&player, 10, 3);
        QSignalSpy spy(&watcher, &EndOfTrackWatcher::endOfTrack);
        watcher.arm(4);
        watcher.start();

        QTRY_VERIFY(player.isPlayingCalls() >= 2);
        player.setPlaying(false);

        QTRY_COMPARE(spy.count(), 1);
        QCOMPARE(spy.at(0).at(0).value<quint64>(), quint64(4));

        // No repeat until re-armed
        QTest::qWait(100);
        QCOMPARE(spy.count(), 1);
    }

    void endOfTrack_ignoresPollsWhilePaused()
    {
        FakeMediaPlayer player;
        player.setPlaying(true);

        EndOfTrackWatcher watcher(&player, 10, 2);
        QSignalSpy spy(&watcher, &EndOfTrackWatcher::endOfTrack);
        watcher.arm(1);
        watcher.start();
        QTRY_VERIFY(player.isPlayingCalls() >= 2);

        watcher.setPaused(true);
        QVERIFY(player.togglePause().ok);
        QTest::qWait(100);
        QCOMPARE(spy.count(), 0);

        watcher.setPaused(false);
        QVERIFY(player.togglePause().ok);
        player.setPlaying(false);
        QTRY_COMPARE(spy.count(), 1);
    }

    // ── PlayingStateConfirmer ────────────────────────────────────
    void confirmer_confirmsWithDuration()
    {
        FakeMediaPlayer player;
        player.setPlaying(true);
        player.setDuration(QStringLiteral("04:10"));

        auto token = SessionToken::create();
        QPointer<PlayingStateConfirmer> confirmer =
            new PlayingStateConfirmer(&player, token, 9, 10, 10, 5);
        QSignalSpy confirmed(confirmer.data(), &PlayingStateConfirmer::confirmed);
        QSignalSpy expired(confirmer.data(), &PlayingStateConfirmer::expired);
        confirmer->start();

        QTRY_COMPARE(confirmed.count(), 1);
        QCOMPARE(confirmed.at(0).at(0).value<quint64>(), quint64(9));
        QCOMPARE(confirmed.at(0).at(1).toString(), QStringLiteral("04:10"));
        QCOMPARE(expired.count(), 0);
        QTRY_VERIFY(confirmer.isNull());
    }

    void confirmer_expiresAfterBudget()
    {
        FakeMediaPlayer player;
        auto token = SessionToken::create();
        QPointer<PlayingStateConfirmer> confirmer =
            new PlayingStateConfirmer(&player, token, 2, 0, 10, 4);
        QSignalSpy confirmed(confirmer.data(), &PlayingStateConfirmer::confirmed);
        QSignalSpy expired(confirmer.data(), &PlayingStateConfirmer::expired);
        confirmer->start();

        QTRY_COMPARE(expired.count(), 1);
        QCOMPARE(expired.at(0).at(0).value<quint64>(), quint64(2));
        QCOMPARE(confirmed.count(), 0);
        QCOMPARE(player.isPlayingCalls(), 4);
    }

    void confirmer_cancelledToken_reportsNothing()
    {
        FakeMediaPlayer player;
        auto token = SessionToken::create();
        QPointer<PlayingStateConfirmer> confirmer =
            new PlayingStateConfirmer(&player, token, 1, 50, 10, 3);
        QSignalSpy confirmed(confirmer.data(), &PlayingStateConfirmer::confirmed);
        QSignalSpy expired(confirmer.data(), &PlayingStateConfirmer::expired);
        QSignalSpy finished(confirmer.data(), &PlayingStateConfirmer::finished);
        confirmer->start();

        token->cancel();
        player.setPlaying(true);

        QTRY_COMPARE(finished.count(), 1);
        QTest::qWait(100);
        QCOMPARE(confirmed.count(), 0);
        QCOMPARE(expired.count(), 0);
        QVERIFY(confirmer.isNull());
    }

    void sessionToken_lastReleaseOffThread_deletesOnOwner()
    {
        auto token = SessionToken::create();
        QAtomicPointer<QThread> destroyedOn;
        connect(token.data(), &QObject::destroyed, [&destroyedOn]() {
            destroyedOn.storeRelease(QThread::currentThread());
        });

        QThread* releaser = QThread::create([held = std::move(token)]() mutable {
            held.reset();
        });
        releaser->start();
        QVERIFY(releaser->wait(5000));
        delete releaser;

        QTRY_VERIFY(destroyedOn.loadAcquire() != nullptr);
        QCOMPARE(destroyedOn.loadAcquire(), QThread::currentThread());
    }

    // ── ListeningTimeAccumulator ─────────────────────────────────
    void listening_addsSecondsWhilePlaying()
    {
        FakeMediaPlayer player;
        UserProfile profile;
        const qint64 before = profile.listenedSeconds();

        ListeningTimeAccumulator acc(&player, &profile, 10);
        acc.start();

        QTest::qWait(60);
        QCOMPARE(profile.listenedSeconds(), before);

        player.setPlaying(true);
        QTRY_VERIFY(profile.listenedSeconds() >= before + 3);
        acc.stop();
    }
};

QTEST_MAIN(tst_PlayerWatchers)
#include "tst_PlayerWatchers.moc"
