#include "UserProfile.h"
#include "Settings.h"
#include "library/HistoryStore.h"

#include <QDebug>
#include <QMutexLocker>
#include <QSettings>
#include <QTimer>
#include <QtConcurrent>

UserProfile::UserProfile(HistoryStore* history, QObject* parent)
    : QObject(parent)
    , m_history(history)
{
    m_saveTimer = new QTimer(this);
    m_saveTimer->setSingleShot(true);
    m_saveTimer->setInterval(2000);
    connect(m_saveTimer, &QTimer::timeout, this, &UserProfile::doSave);

    load();
}

UserProfile::~UserProfile()
{
    flush();
}

QString UserProfile::name() const
{
    QMutexLocker lock(&m_mutex);
    return m_name;
}

qint64 UserProfile::listenedSeconds() const
{
    QMutexLocker lock(&m_mutex);
    return m_listenedSeconds;
}

qint64 UserProfile::songsPlayed() const
{
    QMutexLocker lock(&m_mutex);
    return m_songsPlayed;
}

std::optional<HistoryEntry> UserProfile::lastPlayed() const
{
    if (!m_history)
        return std::nullopt;

    auto last = m_history->lastPlayed();
    if (!last.ok) {
        qWarning() << "[Profile] Cannot read last played:" << last.error;
        return std::nullopt;
    }
    return last.value;
}

void UserProfile::addListenedSeconds(qint64 seconds)
{
    {
        QMutexLocker lock(&m_mutex);
        m_listenedSeconds += seconds;
    }
    emit statsChanged();
    // May be called from the polling thread; the timer belongs to ours
    QMetaObject::invokeMethod(this, &UserProfile::scheduleSave, Qt::QueuedConnection);
}

void UserProfile::incrementSongsPlayed()
{
    {
        QMutexLocker lock(&m_mutex);
        ++m_songsPlayed;
    }
    emit statsChanged();
    QMetaObject::invokeMethod(this, &UserProfile::scheduleSave, Qt::QueuedConnection);
}

void UserProfile::load()
{
    auto* settings = Settings::instance();
    QMutexLocker lock(&m_mutex);
    m_name = settings->profileName();
    m_listenedSeconds = settings->listenedSeconds();
    m_songsPlayed = settings->songsPlayed();
}

void UserProfile::scheduleSave()
{
    m_saveTimer->start();
}

void UserProfile::doSave()
{
    qint64 listened;
    qint64 played;
    {
        QMutexLocker lock(&m_mutex);
        listened = m_listenedSeconds;
        played = m_songsPlayed;
    }

    m_pendingSave = QtConcurrent::run([listened, played]() {
        static QMutex mutex;
        QMutexLocker lock(&mutex);

        QSettings settings(Settings::settingsPath(), QSettings::IniFormat);
        settings.setValue(QStringLiteral("profile/listenedSeconds"), listened);
        settings.setValue(QStringLiteral("profile/songsPlayed"), played);
        settings.sync();

        qDebug() << "[Profile] Saved (async) listened:" << listened << "s, songs:" << played;
    });
}

void UserProfile::flush()
{
    if (m_saveTimer->isActive())
        m_saveTimer->stop();
    m_pendingSave.waitForFinished();

    auto* settings = Settings::instance();
    QMutexLocker lock(&m_mutex);
    settings->setListenedSeconds(m_listenedSeconds);
    settings->setSongsPlayed(m_songsPlayed);
    settings->sync();
}
