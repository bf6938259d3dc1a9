#include "Commands.h"
#include "../core/UserProfile.h"
#include "../core/library/HistoryStore.h"
#include "../core/library/PlaylistStore.h"

#include <QDateTime>
#include <QDebug>

namespace Cli {

static int fail(QTextStream& out, const Error& error)
{
    out << "error: " << error.message << Qt::endl;
    qWarning() << "[Cli]" << error;
    return error.category == ErrorCategory::Storage ? 2 : 1;
}

static int usage(QTextStream& out, const QString& text)
{
    out << "usage: " << text << Qt::endl;
    return 1;
}

static int intOption(const QCommandLineParser& parser, const QString& name, int fallback)
{
    if (!parser.isSet(name))
        return fallback;
    bool ok = false;
    const int value = parser.value(name).toInt(&ok);
    return ok && value >= 0 ? value : fallback;
}

void addCommandOptions(QCommandLineParser& parser)
{
    parser.addOption({QStringLiteral("title"),
                      QStringLiteral("Track title (defaults to the id)."),
                      QStringLiteral("title")});
    parser.addOption({QStringLiteral("artist"),
                      QStringLiteral("Track artist; repeat for several."),
                      QStringLiteral("artist")});
    parser.addOption({QStringLiteral("offset"),
                      QStringLiteral("First position to list."),
                      QStringLiteral("n")});
    parser.addOption({QStringLiteral("limit"),
                      QStringLiteral("Number of entries to list."),
                      QStringLiteral("n")});
    parser.addOption({QStringLiteral("start"),
                      QStringLiteral("Playlist position to start playing from."),
                      QStringLiteral("n")});
}

Track trackFromArguments(const QString& id, const QCommandLineParser& parser)
{
    Track t;
    t.id = id;
    t.title = parser.isSet(QStringLiteral("title")) ? parser.value(QStringLiteral("title")) : id;
    t.artists = parser.values(QStringLiteral("artist"));
    return t;
}

QString describeTrack(const Track& track)
{
    if (track.artists.isEmpty())
        return QStringLiteral("%1 [%2]").arg(track.title, track.id);
    return QStringLiteral("%1 - %2 [%3]").arg(track.title, track.artistLine(), track.id);
}

// ── playlist ────────────────────────────────────────────────────────
int runPlaylistCommand(const QStringList& args, const QCommandLineParser& parser,
                       const Context& ctx, QTextStream& out)
{
    const QString sub = args.value(0);
    const QString name = args.value(1);

    if (sub == QLatin1String("list")) {
        auto names = ctx.playlists->listNames();
        if (!names.ok) return fail(out, names.error);
        for (const auto& n : names.value)
            out << n << Qt::endl;
        return 0;
    }

    if (name.isEmpty())
        return usage(out, QStringLiteral("quaver playlist create|add|remove|show|delete <name> ..."));

    if (sub == QLatin1String("create")) {
        auto created = ctx.playlists->create(name);
        if (!created.ok) return fail(out, created.error);
        out << "created playlist " << name << Qt::endl;
        return 0;
    }

    if (sub == QLatin1String("delete")) {
        auto removed = ctx.playlists->remove(name);
        if (!removed.ok) return fail(out, removed.error);
        out << "deleted playlist " << name << Qt::endl;
        return 0;
    }

    if (sub == QLatin1String("add")) {
        const QString id = args.value(2);
        if (id.isEmpty())
            return usage(out, QStringLiteral("quaver playlist add <name> <track-id> [--title T] [--artist A]"));
        auto added = ctx.playlists->addTrack(name, trackFromArguments(id, parser));
        if (!added.ok) return fail(out, added.error);
        out << "added " << describeTrack(added.value.track) << " to " << name << Qt::endl;
        return 0;
    }

    if (sub == QLatin1String("remove")) {
        const QString id = args.value(2);
        if (id.isEmpty())
            return usage(out, QStringLiteral("quaver playlist remove <name> <track-id>"));
        auto removed = ctx.playlists->removeTrack(name, id);
        if (!removed.ok) return fail(out, removed.error);
        out << (removed.value ? "removed " : "not in playlist: ") << id << Qt::endl;
        return 0;
    }

    if (sub == QLatin1String("show")) {
        auto page = ctx.playlists->materialize(name);
        if (!page.ok) return fail(out, page.error);

        const int offset = intOption(parser, QStringLiteral("offset"), 0);
        const auto tracks = page.value->page(static_cast<quint64>(offset));
        int position = offset;
        for (const auto& t : tracks)
            out << QString::number(position++).rightJustified(4) << "  " << describeTrack(t) << Qt::endl;
        out << "(" << tracks.size() << " of " << page.value->length() << ")" << Qt::endl;
        return 0;
    }

    return usage(out, QStringLiteral("quaver playlist list|create|add|remove|show|delete|play"));
}

// ── history ─────────────────────────────────────────────────────────
static void printHistory(const QVector<HistoryEntry>& entries, QTextStream& out)
{
    for (const auto& e : entries) {
        const QString when = QDateTime::fromSecsSinceEpoch(e.lastPlayedAt)
                                 .toString(QStringLiteral("yyyy-MM-dd HH:mm"));
        out << when << "  x" << QString::number(e.playCount).leftJustified(4)
            << describeTrack(e.track) << Qt::endl;
    }
}

int runHistoryCommand(const QStringList& args, const QCommandLineParser& parser,
                      const Context& ctx, QTextStream& out)
{
    const QString sub = args.value(0, QStringLiteral("recent"));

    if (sub == QLatin1String("recent")) {
        const int offset = intOption(parser, QStringLiteral("offset"), 0);
        const int limit = intOption(parser, QStringLiteral("limit"), ctx.historyPageSize);
        auto page = ctx.history->recent(offset, limit);
        if (!page.ok) return fail(out, page.error);
        printHistory(page.value, out);

        auto total = ctx.history->count();
        if (!total.ok) return fail(out, total.error);
        out << "(" << page.value.size() << " of " << total.value << ")" << Qt::endl;
        return 0;
    }

    if (sub == QLatin1String("top")) {
        auto top = ctx.history->mostPlayed(intOption(parser, QStringLiteral("limit"), 10));
        if (!top.ok) return fail(out, top.error);
        printHistory(top.value, out);
        return 0;
    }

    if (sub == QLatin1String("delete")) {
        const QString id = args.value(1);
        if (id.isEmpty())
            return usage(out, QStringLiteral("quaver history delete <track-id>"));
        auto removed = ctx.history->remove(id);
        if (!removed.ok) return fail(out, removed.error);
        out << (removed.value ? "deleted " : "not in history: ") << id << Qt::endl;
        return 0;
    }

    if (sub == QLatin1String("clear")) {
        auto cleared = ctx.history->clearAll();
        if (!cleared.ok) return fail(out, cleared.error);
        out << "history cleared" << Qt::endl;
        return 0;
    }

    return usage(out, QStringLiteral("quaver history recent|top|delete|clear"));
}

// ── profile ─────────────────────────────────────────────────────────
int runProfileCommand(const Context& ctx, QTextStream& out)
{
    const qint64 listened = ctx.profile->listenedSeconds();
    out << "name:          " << ctx.profile->name() << Qt::endl;
    out << "listened:      " << listened / 3600 << "h " << (listened % 3600) / 60 << "m" << Qt::endl;
    out << "songs played:  " << ctx.profile->songsPlayed() << Qt::endl;

    const auto last = ctx.profile->lastPlayed();
    out << "last played:   " << (last ? describeTrack(last->track) : QStringLiteral("-")) << Qt::endl;
    return 0;
}

} // namespace Cli
