#include "Settings.h"
#include <QDir>
#include <QStandardPaths>
#include <QDebug>

// ── Settings INI path ───────────────────────────────────────────────
// <GenericDataLocation>/Quaver/settings.ini
QString Settings::settingsPath()
{
    QDir dir(QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
             + QStringLiteral("/Quaver"));
    if (!dir.exists()) dir.mkpath(QStringLiteral("."));
    return dir.filePath(QStringLiteral("settings.ini"));
}

// ── Singleton ───────────────────────────────────────────────────────
Settings* Settings::instance()
{
    static Settings s;
    return &s;
}

// ── Constructor ─────────────────────────────────────────────────────
Settings::Settings(QObject* parent)
    : QObject(parent)
    , m_settings(settingsPath(), QSettings::IniFormat)
{
    qDebug() << "[Settings] INI path:" << m_settings.fileName();
}

void Settings::sync()
{
    m_settings.sync();
    if (m_settings.status() != QSettings::NoError)
        qWarning() << "[Settings] Failed to write" << m_settings.fileName();
}

// ── Library ─────────────────────────────────────────────────────────
QString Settings::dataDir() const
{
    const QString fallback = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
                             + QStringLiteral("/Quaver");
    return m_settings.value(QStringLiteral("library/dataDir"), fallback).toString();
}

void Settings::setDataDir(const QString& dir)
{
    m_settings.setValue(QStringLiteral("library/dataDir"), dir);
    emit dataDirChanged(dir);
}

QString Settings::historyDbPath() const
{
    return QDir(dataDir()).filePath(QStringLiteral("history.db"));
}

QString Settings::playlistsDbPath() const
{
    return QDir(dataDir()).filePath(QStringLiteral("playlists.db"));
}

QString Settings::logFilePath() const
{
    return QDir(dataDir()).filePath(QStringLiteral("quaver.log"));
}

// ── Player ──────────────────────────────────────────────────────────
QString Settings::playerExecutable() const
{
    return m_settings.value(QStringLiteral("player/executable"), QStringLiteral("mpv")).toString();
}

void Settings::setPlayerExecutable(const QString& path)
{
    m_settings.setValue(QStringLiteral("player/executable"), path);
}

QString Settings::playerIpcSocket() const
{
    const QString fallback = QDir(QStandardPaths::writableLocation(QStandardPaths::TempLocation))
                                 .filePath(QStringLiteral("quaver-mpv.sock"));
    return m_settings.value(QStringLiteral("player/ipcSocket"), fallback).toString();
}

void Settings::setPlayerIpcSocket(const QString& path)
{
    m_settings.setValue(QStringLiteral("player/ipcSocket"), path);
}

QString Settings::cookiesFile() const
{
    return m_settings.value(QStringLiteral("player/cookiesFile")).toString();
}

void Settings::setCookiesFile(const QString& path)
{
    m_settings.setValue(QStringLiteral("player/cookiesFile"), path);
}

QString Settings::mediaUrlTemplate() const
{
    return m_settings.value(QStringLiteral("player/mediaUrlTemplate"),
                            QStringLiteral("https://www.youtube.com/watch?v=%1")).toString();
}

void Settings::setMediaUrlTemplate(const QString& tmpl)
{
    m_settings.setValue(QStringLiteral("player/mediaUrlTemplate"), tmpl);
}

int Settings::seekStepSeconds() const
{
    return m_settings.value(QStringLiteral("player/seekStepSeconds"), 10).toInt();
}

void Settings::setSeekStepSeconds(int seconds)
{
    m_settings.setValue(QStringLiteral("player/seekStepSeconds"), seconds);
}

int Settings::volumeStep() const
{
    return m_settings.value(QStringLiteral("player/volumeStep"), 5).toInt();
}

void Settings::setVolumeStep(int step)
{
    m_settings.setValue(QStringLiteral("player/volumeStep"), step);
}

// ── Playback polling ────────────────────────────────────────────────
int Settings::positionPollMs() const
{
    return m_settings.value(QStringLiteral("playback/positionPollMs"), 500).toInt();
}

void Settings::setPositionPollMs(int ms)
{
    m_settings.setValue(QStringLiteral("playback/positionPollMs"), ms);
}

int Settings::endOfTrackPollMs() const
{
    return m_settings.value(QStringLiteral("playback/endOfTrackPollMs"), 1000).toInt();
}

void Settings::setEndOfTrackPollMs(int ms)
{
    m_settings.setValue(QStringLiteral("playback/endOfTrackPollMs"), ms);
}

int Settings::endOfTrackIdleThreshold() const
{
    return m_settings.value(QStringLiteral("playback/endOfTrackIdleThreshold"), 3).toInt();
}

void Settings::setEndOfTrackIdleThreshold(int polls)
{
    m_settings.setValue(QStringLiteral("playback/endOfTrackIdleThreshold"), polls);
}

int Settings::confirmInitialDelayMs() const
{
    return m_settings.value(QStringLiteral("playback/confirmInitialDelayMs"), 1000).toInt();
}

void Settings::setConfirmInitialDelayMs(int ms)
{
    m_settings.setValue(QStringLiteral("playback/confirmInitialDelayMs"), ms);
}

int Settings::confirmPollMs() const
{
    return m_settings.value(QStringLiteral("playback/confirmPollMs"), 1000).toInt();
}

void Settings::setConfirmPollMs(int ms)
{
    m_settings.setValue(QStringLiteral("playback/confirmPollMs"), ms);
}

int Settings::confirmIdleBudget() const
{
    return m_settings.value(QStringLiteral("playback/confirmIdleBudget"), 10).toInt();
}

void Settings::setConfirmIdleBudget(int polls)
{
    m_settings.setValue(QStringLiteral("playback/confirmIdleBudget"), polls);
}

int Settings::listeningPollMs() const
{
    return m_settings.value(QStringLiteral("playback/listeningPollMs"), 1000).toInt();
}

void Settings::setListeningPollMs(int ms)
{
    m_settings.setValue(QStringLiteral("playback/listeningPollMs"), ms);
}

// ── History ─────────────────────────────────────────────────────────
int Settings::historyPageSize() const
{
    return m_settings.value(QStringLiteral("history/pageSize"), 20).toInt();
}

void Settings::setHistoryPageSize(int size)
{
    m_settings.setValue(QStringLiteral("history/pageSize"), size);
}

// ── Profile ─────────────────────────────────────────────────────────
QString Settings::profileName() const
{
    return m_settings.value(QStringLiteral("profile/name"), qEnvironmentVariable("USER")).toString();
}

void Settings::setProfileName(const QString& name)
{
    m_settings.setValue(QStringLiteral("profile/name"), name);
    emit profileNameChanged(name);
}

qint64 Settings::listenedSeconds() const
{
    return m_settings.value(QStringLiteral("profile/listenedSeconds"), 0).toLongLong();
}

void Settings::setListenedSeconds(qint64 seconds)
{
    m_settings.setValue(QStringLiteral("profile/listenedSeconds"), seconds);
}

qint64 Settings::songsPlayed() const
{
    return m_settings.value(QStringLiteral("profile/songsPlayed"), 0).toLongLong();
}

void Settings::setSongsPlayed(qint64 count)
{
    m_settings.setValue(QStringLiteral("profile/songsPlayed"), count);
}
