#pragma once

#include <QCommandLineParser>
#include <QStringList>
#include <QTextStream>

#include "../core/MusicData.h"

class HistoryStore;
class PlaylistStore;
class UserProfile;

namespace Cli {

struct Context {
    HistoryStore*  history = nullptr;
    PlaylistStore* playlists = nullptr;
    UserProfile*   profile = nullptr;
    int            historyPageSize = 20;
};

// Registers the options shared by the sub-commands.
void addCommandOptions(QCommandLineParser& parser);

// Builds a Track from an id plus the --title/--artist options.
Track trackFromArguments(const QString& id, const QCommandLineParser& parser);

QString describeTrack(const Track& track);

// Each returns a process exit code; `args` excludes the command word.
int runPlaylistCommand(const QStringList& args, const QCommandLineParser& parser,
                       const Context& ctx, QTextStream& out);
int runHistoryCommand(const QStringList& args, const QCommandLineParser& parser,
                      const Context& ctx, QTextStream& out);
int runProfileCommand(const Context& ctx, QTextStream& out);

} // namespace Cli
