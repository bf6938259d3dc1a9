#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QMutex>
#include <QTextStream>
#include <cstdio>

#include "cli/Commands.h"
#include "cli/ConsoleSession.h"
#include "core/Settings.h"
#include "core/UserProfile.h"
#include "core/library/HistoryStore.h"
#include "core/library/PlaylistStore.h"
#include "core/playback/MpvIpcPlayer.h"
#include "core/playback/PlaybackConfig.h"
#include "core/playback/PlaybackController.h"

// ── File logging ────────────────────────────────────────────────────
static QFile s_logFile;

static void installLogHandler(const QString& logPath)
{
    s_logFile.setFileName(logPath);
    if (!s_logFile.open(QIODevice::WriteOnly | QIODevice::Append)) {
        fprintf(stderr, "cannot open log file %s\n", qPrintable(logPath));
        return;
    }

    qInstallMessageHandler([](QtMsgType type, const QMessageLogContext&, const QString& msg) {
        static QMutex mtx;
        QMutexLocker lock(&mtx);
        QString line = QStringLiteral("[%1] %2\n")
            .arg(QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd HH:mm:ss.zzz")), msg);
        QByteArray utf8 = line.toUtf8();
        s_logFile.write(utf8);
        s_logFile.flush();
        if (type != QtDebugMsg && type != QtInfoMsg)
            fprintf(stderr, "%s", utf8.constData());
    });
}

// ── Playback session ────────────────────────────────────────────────
static int runPlayback(QCoreApplication& app, const QStringList& args,
                       const QCommandLineParser& parser, const Cli::Context& ctx,
                       QTextStream& out)
{
    const bool playlistMode = args.value(0) == QLatin1String("playlist");
    const QString target = playlistMode ? args.value(2) : args.value(1);
    if (target.isEmpty()) {
        out << "usage: quaver play <track-id> | quaver playlist play <name> [--start N]" << Qt::endl;
        return 1;
    }

    QSharedPointer<SongPageStore> playlist;
    if (playlistMode) {
        auto page = ctx.playlists->materialize(target);
        if (!page.ok) {
            out << "error: " << page.error.message << Qt::endl;
            return 1;
        }
        playlist = page.value;
    }

    auto* settings = Settings::instance();
    MpvIpcPlayer player(MpvIpcPlayer::Options::fromSettings());
    auto launched = player.launch();
    if (!launched.ok) {
        qCritical() << "[Main] Cannot start player:" << launched.error;
        out << "error: " << launched.error.message << Qt::endl;
        return 3;
    }

    PlaybackController controller(&player, ctx.history, ctx.profile, PlaybackConfig::fromSettings());
    ConsoleSession console(&controller, settings->seekStepSeconds(), settings->volumeStep());
    QObject::connect(&console, &ConsoleSession::quitRequested, &app, &QCoreApplication::quit);
    QObject::connect(&player, &MpvIpcPlayer::processExited, &app, [&app](int) { app.exit(3); });

    controller.start();
    Result<void> started = playlistMode
        ? controller.playPlaylist(playlist, static_cast<quint64>(parser.value(QStringLiteral("start")).toULongLong()))
        : controller.playTrack(Cli::trackFromArguments(target, parser));
    if (!started.ok) {
        out << "error: " << started.error.message << Qt::endl;
        controller.shutdown();
        return 1;
    }

    console.start();
    const int rc = app.exec();

    controller.shutdown();
    player.terminate();
    return rc;
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName(QStringLiteral("Quaver"));
    app.setApplicationName(QStringLiteral("quaver"));
    app.setApplicationVersion(QStringLiteral(QUAVER_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Headless music playback session controller"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
        QStringLiteral("play <id> | playlist <list|create|add|remove|show|delete|play> | "
                       "history [recent|top|delete|clear] | profile"));
    parser.addOption({QStringLiteral("data-dir"),
                      QStringLiteral("Directory for the history and playlist databases."),
                      QStringLiteral("dir")});
    Cli::addCommandOptions(parser);
    parser.process(app);

    QTextStream out(stdout);
    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        parser.showHelp(1);

    auto* settings = Settings::instance();
    if (parser.isSet(QStringLiteral("data-dir")))
        settings->setDataDir(parser.value(QStringLiteral("data-dir")));
    QDir().mkpath(settings->dataDir());

    installLogHandler(settings->logFilePath());
    qInfo() << "=== quaver" << app.applicationVersion() << "started ==="
            << "PID:" << QCoreApplication::applicationPid() << "args:" << args;

    // Both stores must open; nothing works without them
    HistoryStore history(settings->historyDbPath());
    auto historyOpened = history.open();
    if (!historyOpened.ok) {
        qCritical() << "[Main] History store unavailable:" << historyOpened.error;
        out << "error: " << historyOpened.error.message << Qt::endl;
        return 2;
    }

    PlaylistStore playlists(settings->playlistsDbPath());
    auto playlistsOpened = playlists.open();
    if (!playlistsOpened.ok) {
        qCritical() << "[Main] Playlist store unavailable:" << playlistsOpened.error;
        out << "error: " << playlistsOpened.error.message << Qt::endl;
        return 2;
    }

    UserProfile profile(&history);

    Cli::Context ctx;
    ctx.history = &history;
    ctx.playlists = &playlists;
    ctx.profile = &profile;
    ctx.historyPageSize = settings->historyPageSize();

    const QString command = args.first();
    const QStringList rest = args.mid(1);
    int rc = 1;

    if (command == QLatin1String("play")
        || (command == QLatin1String("playlist") && rest.value(0) == QLatin1String("play"))) {
        rc = runPlayback(app, args, parser, ctx, out);
    } else if (command == QLatin1String("playlist")) {
        rc = Cli::runPlaylistCommand(rest, parser, ctx, out);
    } else if (command == QLatin1String("history")) {
        rc = Cli::runHistoryCommand(rest, parser, ctx, out);
    } else if (command == QLatin1String("profile")) {
        rc = Cli::runProfileCommand(ctx, out);
    } else {
        out << "unknown command: " << command << Qt::endl;
        parser.showHelp(1);
    }

    profile.flush();
    settings->sync();
    qInfo() << "=== quaver exiting with" << rc << "===";
    return rc;
}
