#include "MpvIpcPlayer.h"
#include "../MusicData.h"
#include "../Settings.h"

#include <QDebug>
#include <QElapsedTimer>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLocalSocket>
#include <QThread>
#include <cmath>

static Error playerError(const QString& message)
{
    return Error{ErrorCategory::Player, message};
}

MpvIpcPlayer::Options MpvIpcPlayer::Options::fromSettings()
{
    auto* s = Settings::instance();

    Options o;
    o.executable = s->playerExecutable();
    o.socketPath = s->playerIpcSocket();
    o.cookiesFile = s->cookiesFile();
    return o;
}

MpvIpcPlayer::MpvIpcPlayer(const Options& options, QObject* parent)
    : QObject(parent)
    , m_options(options)
{
    m_process = new QProcess(this);
    m_process->setProcessChannelMode(QProcess::ForwardedErrorChannel);
    connect(m_process, &QProcess::finished, this,
            [this](int exitCode, QProcess::ExitStatus status) {
        if (status == QProcess::CrashExit)
            qWarning() << "[Mpv] Player process crashed";
        else
            qDebug() << "[Mpv] Player process exited with code" << exitCode;
        emit processExited(exitCode);
    });
}

MpvIpcPlayer::~MpvIpcPlayer()
{
    terminate();
}

// ═════════════════════════════════════════════════════════════════════
//  Process lifecycle
// ═════════════════════════════════════════════════════════════════════

QStringList MpvIpcPlayer::launchArguments() const
{
    QStringList args{
        QStringLiteral("--idle=yes"),
        QStringLiteral("--no-video"),
        QStringLiteral("--no-terminal"),
        QStringLiteral("--input-ipc-server=%1").arg(m_options.socketPath),
    };
    if (!m_options.cookiesFile.isEmpty())
        args << QStringLiteral("--ytdl-raw-options=cookies=%1").arg(m_options.cookiesFile);
    return args;
}

Result<void> MpvIpcPlayer::launch()
{
    if (m_process->state() != QProcess::NotRunning)
        return Result<void>::success();

    // A stale socket from a previous run would accept no connections
    if (QFile::exists(m_options.socketPath))
        QFile::remove(m_options.socketPath);

    m_process->start(m_options.executable, launchArguments());
    if (!m_process->waitForStarted(m_options.startupTimeoutMs))
        return Result<void>::failure(playerError(
            QStringLiteral("cannot start %1: %2").arg(m_options.executable, m_process->errorString())));

    // mpv creates the socket shortly after start
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < m_options.startupTimeoutMs) {
        QLocalSocket probe;
        probe.connectToServer(m_options.socketPath);
        if (probe.waitForConnected(100)) {
            probe.disconnectFromServer();
            qDebug() << "[Mpv] Player ready on" << m_options.socketPath
                     << "after" << timer.elapsed() << "ms";
            return Result<void>::success();
        }
        QThread::msleep(50);
    }

    terminate();
    return Result<void>::failure(playerError(
        QStringLiteral("player IPC socket %1 did not come up").arg(m_options.socketPath)));
}

void MpvIpcPlayer::terminate()
{
    if (m_process->state() == QProcess::NotRunning)
        return;

    auto quit = command(QJsonArray{QStringLiteral("quit")});
    if (!quit.ok)
        qDebug() << "[Mpv] quit command failed, killing player:" << quit.error;
    if (!m_process->waitForFinished(1000)) {
        m_process->kill();
        m_process->waitForFinished(1000);
    }
}

// ═════════════════════════════════════════════════════════════════════
//  IPC
// ═════════════════════════════════════════════════════════════════════

Result<QJsonValue> MpvIpcPlayer::command(const QJsonArray& args)
{
    using R = Result<QJsonValue>;

    const qint64 requestId = m_nextRequestId.fetchAndAddRelaxed(1);

    QLocalSocket socket;
    socket.connectToServer(m_options.socketPath);
    if (!socket.waitForConnected(m_options.commandTimeoutMs))
        return R::failure(playerError(QStringLiteral("cannot connect to player: %1").arg(socket.errorString())));

    QJsonObject request;
    request[QStringLiteral("command")] = args;
    request[QStringLiteral("request_id")] = requestId;
    socket.write(QJsonDocument(request).toJson(QJsonDocument::Compact) + '\n');
    if (!socket.waitForBytesWritten(m_options.commandTimeoutMs))
        return R::failure(playerError(QStringLiteral("cannot send command to player")));

    // Replies are interleaved with event lines; wait for ours
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < m_options.commandTimeoutMs) {
        while (socket.canReadLine()) {
            const QJsonDocument doc = QJsonDocument::fromJson(socket.readLine());
            const QJsonObject reply = doc.object();
            if (reply.value(QStringLiteral("request_id")).toInteger(-1) != requestId)
                continue;

            const QString status = reply.value(QStringLiteral("error")).toString();
            if (status != QLatin1String("success"))
                return R::failure(playerError(QStringLiteral("%1: %2")
                    .arg(args.first().toString(), status)));
            return R::success(reply.value(QStringLiteral("data")));
        }
        if (!socket.waitForReadyRead(static_cast<int>(m_options.commandTimeoutMs - timer.elapsed())))
            break;
    }
    return R::failure(playerError(QStringLiteral("timed out waiting for %1").arg(args.first().toString())));
}

Result<QJsonValue> MpvIpcPlayer::property(const QString& name)
{
    return command(QJsonArray{QStringLiteral("get_property"), name});
}

// ═════════════════════════════════════════════════════════════════════
//  IMediaPlayer
// ═════════════════════════════════════════════════════════════════════

Result<void> MpvIpcPlayer::play(const QString& url)
{
    auto r = command(QJsonArray{QStringLiteral("loadfile"), url, QStringLiteral("replace")});
    if (!r.ok) return Result<void>::failure(r.error);

    // loadfile keeps the previous pause state
    auto unpause = command(QJsonArray{QStringLiteral("set_property"), QStringLiteral("pause"), false});
    if (!unpause.ok) return Result<void>::failure(unpause.error);
    return Result<void>::success();
}

Result<void> MpvIpcPlayer::togglePause()
{
    auto r = command(QJsonArray{QStringLiteral("cycle"), QStringLiteral("pause")});
    if (!r.ok) return Result<void>::failure(r.error);
    return Result<void>::success();
}

Result<void> MpvIpcPlayer::seek(int seconds)
{
    auto r = command(QJsonArray{QStringLiteral("seek"), seconds, QStringLiteral("relative")});
    if (!r.ok) return Result<void>::failure(r.error);
    return Result<void>::success();
}

Result<void> MpvIpcPlayer::adjustVolume(int delta)
{
    auto r = command(QJsonArray{QStringLiteral("add"), QStringLiteral("volume"), delta});
    if (!r.ok) return Result<void>::failure(r.error);
    return Result<void>::success();
}

Result<void> MpvIpcPlayer::setLoop(bool enabled)
{
    auto r = command(QJsonArray{QStringLiteral("set_property"), QStringLiteral("loop-file"),
                                enabled ? QStringLiteral("inf") : QStringLiteral("no")});
    if (!r.ok) return Result<void>::failure(r.error);
    return Result<void>::success();
}

Result<bool> MpvIpcPlayer::isPlaying()
{
    // core-idle is true while paused, buffering, or with nothing loaded
    auto idle = property(QStringLiteral("core-idle"));
    if (!idle.ok) return Result<bool>::failure(idle.error);
    return Result<bool>::success(!idle.value.toBool(true));
}

QString MpvIpcPlayer::duration()
{
    auto d = property(QStringLiteral("duration"));
    if (!d.ok || !d.value.isDouble())
        return formatDuration(0);
    return formatDuration(static_cast<qint64>(std::floor(d.value.toDouble())));
}

Result<int> MpvIpcPlayer::currentVolume()
{
    auto v = property(QStringLiteral("volume"));
    if (!v.ok) return Result<int>::failure(v.error);
    return Result<int>::success(static_cast<int>(std::lround(v.value.toDouble())));
}

Result<double> MpvIpcPlayer::position()
{
    auto p = property(QStringLiteral("time-pos"));
    if (!p.ok) return Result<double>::failure(p.error);
    if (!p.value.isDouble())
        return Result<double>::failure(playerError(QStringLiteral("no position available")));
    return Result<double>::success(p.value.toDouble());
}
