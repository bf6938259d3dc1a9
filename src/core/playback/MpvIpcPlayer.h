#pragma once

#include <QAtomicInteger>
#include <QJsonArray>
#include <QJsonValue>
#include <QMutex>
#include <QObject>
#include <QProcess>
#include <QString>

#include "IMediaPlayer.h"

// IMediaPlayer backed by an mpv process controlled over its JSON IPC socket.
//
// Each command opens its own QLocalSocket, so calls from the controller
// and the polling thread never share a connection.
class MpvIpcPlayer : public QObject, public IMediaPlayer {
    Q_OBJECT

public:
    struct Options {
        QString executable = QStringLiteral("mpv");
        QString socketPath;
        QString cookiesFile;
        int startupTimeoutMs = 5000;
        int commandTimeoutMs = 2000;

        static Options fromSettings();
    };

    explicit MpvIpcPlayer(const Options& options, QObject* parent = nullptr);
    ~MpvIpcPlayer() override;

    Result<void> launch();
    void terminate();
    QStringList launchArguments() const;

    // ── IMediaPlayer ─────────────────────────────────────────────────
    Result<void> play(const QString& url) override;
    Result<void> togglePause() override;
    Result<void> seek(int seconds) override;
    Result<void> adjustVolume(int delta) override;
    Result<void> setLoop(bool enabled) override;

    Result<bool> isPlaying() override;
    QString duration() override;
    Result<int> currentVolume() override;
    Result<double> position() override;

signals:
    void processExited(int exitCode);

private:
    Result<QJsonValue> command(const QJsonArray& args);
    Result<QJsonValue> property(const QString& name);

    Options m_options;
    QProcess* m_process;
    QAtomicInteger<qint64> m_nextRequestId{1};
};
