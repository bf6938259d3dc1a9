#pragma once

#include <QObject>
#include <QSettings>
#include <QString>

class Settings : public QObject {
    Q_OBJECT

public:
    static Settings* instance();

    // ── Library ──────────────────────────────────────────────────────
    // Directory holding history.db, playlists.db and quaver.log
    QString dataDir() const;
    void setDataDir(const QString& dir);
    QString historyDbPath() const;
    QString playlistsDbPath() const;
    QString logFilePath() const;

    // ── Player ───────────────────────────────────────────────────────
    QString playerExecutable() const;
    void setPlayerExecutable(const QString& path);

    QString playerIpcSocket() const;
    void setPlayerIpcSocket(const QString& path);

    // Passed to mpv as --ytdl-raw-options=cookies=<file> when non-empty
    QString cookiesFile() const;
    void setCookiesFile(const QString& path);

    // %1 is replaced with the track id
    QString mediaUrlTemplate() const;
    void setMediaUrlTemplate(const QString& tmpl);

    int seekStepSeconds() const;
    void setSeekStepSeconds(int seconds);

    int volumeStep() const;
    void setVolumeStep(int step);

    // ── Playback polling ─────────────────────────────────────────────
    int positionPollMs() const;
    void setPositionPollMs(int ms);

    int endOfTrackPollMs() const;
    void setEndOfTrackPollMs(int ms);

    int endOfTrackIdleThreshold() const;
    void setEndOfTrackIdleThreshold(int polls);

    int confirmInitialDelayMs() const;
    void setConfirmInitialDelayMs(int ms);

    int confirmPollMs() const;
    void setConfirmPollMs(int ms);

    int confirmIdleBudget() const;
    void setConfirmIdleBudget(int polls);

    int listeningPollMs() const;
    void setListeningPollMs(int ms);

    // ── History ──────────────────────────────────────────────────────
    int historyPageSize() const;
    void setHistoryPageSize(int size);

    // ── Profile ──────────────────────────────────────────────────────
    QString profileName() const;
    void setProfileName(const QString& name);

    qint64 listenedSeconds() const;
    void setListenedSeconds(qint64 seconds);

    qint64 songsPlayed() const;
    void setSongsPlayed(qint64 count);

    void sync();

    static QString settingsPath();

signals:
    void dataDirChanged(const QString& dir);
    void profileNameChanged(const QString& name);

private:
    explicit Settings(QObject* parent = nullptr);
    QSettings m_settings;
};
