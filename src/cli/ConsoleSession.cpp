#include "ConsoleSession.h"
#include "Commands.h"

#include <QDebug>
#include <QMetaEnum>
#include <QSocketNotifier>
#include <cstdio>

ConsoleSession::ConsoleSession(PlaybackController* controller, int seekStepSeconds, int volumeStep,
                               QObject* parent)
    : QObject(parent)
    , m_controller(controller)
    , m_seekStep(seekStepSeconds)
    , m_volumeStep(volumeStep)
    , m_out(stdout)
{
    connect(m_controller, &PlaybackController::nowPlayingChanged,
            this, &ConsoleSession::onNowPlayingChanged);
    connect(m_controller, &PlaybackController::stateChanged,
            this, &ConsoleSession::onStateChanged);
    connect(m_controller, &PlaybackController::playlistSessionEnded, this, [this]() {
        m_out << "-- playlist finished --" << Qt::endl;
    });
    connect(m_controller, &PlaybackController::playbackError, this, [this](const QString& message) {
        m_out << "player error: " << message << Qt::endl;
    });
}

void ConsoleSession::start()
{
    if (!m_stdin.open(fileno(stdin), QIODevice::ReadOnly | QIODevice::Unbuffered)) {
        qWarning() << "[Console] Cannot read stdin:" << m_stdin.errorString();
        emit quitRequested();
        return;
    }
    m_notifier = new QSocketNotifier(fileno(stdin), QSocketNotifier::Read, this);
    connect(m_notifier, &QSocketNotifier::activated, this, &ConsoleSession::onStdinReady);
    printHelp();
}

void ConsoleSession::onStdinReady()
{
    const QByteArray raw = m_stdin.readLine();
    if (raw.isEmpty()) {
        // EOF
        m_notifier->setEnabled(false);
        emit quitRequested();
        return;
    }

    QString line = QString::fromUtf8(raw);
    line.chop(line.endsWith(QLatin1Char('\n')) ? 1 : 0);
    if (!handleCommand(line))
        emit quitRequested();
}

bool ConsoleSession::handleCommand(const QString& line)
{
    // A bare space toggles pause, so only the newline is stripped
    const QString cmd = line == QLatin1String(" ") ? line : line.trimmed();

    Result<void> result = Result<void>::success();
    if (cmd == QLatin1String("q")) {
        return false;
    } else if (cmd == QLatin1String("n")) {
        result = m_controller->advance(PlaybackController::Direction::Next);
    } else if (cmd == QLatin1String("p")) {
        result = m_controller->advance(PlaybackController::Direction::Previous);
    } else if (cmd == QLatin1String(" ") || cmd == QLatin1String("space")) {
        result = m_controller->togglePause();
    } else if (cmd == QLatin1String("+")) {
        result = m_controller->adjustVolume(m_volumeStep);
    } else if (cmd == QLatin1String("-")) {
        result = m_controller->adjustVolume(-m_volumeStep);
    } else if (cmd == QLatin1String(">")) {
        result = m_controller->seek(m_seekStep);
    } else if (cmd == QLatin1String("<")) {
        result = m_controller->seek(-m_seekStep);
    } else if (cmd == QLatin1String("s")) {
        m_controller->stopPlaylistMode();
    } else if (cmd == QLatin1String("i")) {
        const auto session = m_controller->snapshot();
        if (session.nowPlaying) {
            const auto& np = *session.nowPlaying;
            m_out << Cli::describeTrack(np.track) << "  "
                  << formatDuration(static_cast<qint64>(np.currentTimeSeconds)) << " / "
                  << np.totalDuration << "  vol " << np.volume
                  << (np.paused ? "  (paused)" : "") << Qt::endl;
        } else {
            m_out << "nothing playing" << Qt::endl;
        }
    } else if (!cmd.isEmpty()) {
        printHelp();
    }

    if (!result.ok)
        m_out << "error: " << result.error.message << Qt::endl;
    return true;
}

void ConsoleSession::onNowPlayingChanged(bool playlistMode)
{
    const auto session = m_controller->snapshot();
    if (!session.currentTrack)
        return;

    m_out << "now playing: " << Cli::describeTrack(*session.currentTrack);
    if (playlistMode && session.activePlaylist && session.currentIndex)
        m_out << "  (" << *session.currentIndex + 1 << "/" << session.activePlaylist->length() << ")";
    m_out << Qt::endl;
}

void ConsoleSession::onStateChanged(PlaybackController::State state)
{
    const auto meta = QMetaEnum::fromType<PlaybackController::State>();
    qDebug() << "[Console] State:" << meta.valueToKey(static_cast<int>(state));
    if (state == PlaybackController::State::Idle)
        m_out << "-- stopped --" << Qt::endl;
}

void ConsoleSession::printHelp()
{
    m_out << "keys: n next, p previous, <space> pause, +/- volume, </> seek, "
             "s leave playlist, i info, q quit" << Qt::endl;
}
