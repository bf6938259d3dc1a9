#include <QtTest/QtTest>
#include "library/SongPageStore.h"

static Track makeTrack(int n)
{
    Track t;
    t.id = QStringLiteral("id%1").arg(n);
    t.title = QStringLiteral("Track %1").arg(n);
    return t;
}

class tst_SongPageStore : public QObject {
    Q_OBJECT

private slots:
    void append_assignsSequentialPositions()
    {
        SongPageStore store;
        QCOMPARE(store.append(makeTrack(0)), quint64(0));
        QCOMPARE(store.append(makeTrack(1)), quint64(1));
        QCOMPARE(store.length(), 2);

        auto t = store.getByPosition(1);
        QVERIFY(t.ok);
        QCOMPARE(t.value.id, QStringLiteral("id1"));
    }

    void getByPosition_emptySlot_notFound()
    {
        SongPageStore store;
        auto r = store.getByPosition(0);
        QVERIFY(!r.ok);
        QCOMPARE(r.error.category, ErrorCategory::NotFound);
    }

    void page_returnsWindowInOrder()
    {
        QVector<Track> tracks;
        for (int i = 0; i < 45; ++i)
            tracks.append(makeTrack(i));
        auto store = SongPageStore::fromTracks(tracks);

        const auto first = store->page(0);
        QCOMPARE(first.size(), SongPageStore::kPageSize);
        QCOMPARE(first.first().id, QStringLiteral("id0"));
        QCOMPARE(first.last().id, QStringLiteral("id19"));

        const auto last = store->page(40);
        QCOMPARE(last.size(), 5);
        QCOMPARE(last.first().id, QStringLiteral("id40"));

        QVERIFY(store->page(100).isEmpty());
    }

    void page_toleratesGaps()
    {
        QVector<Track> tracks;
        for (int i = 0; i < 10; ++i)
            tracks.append(makeTrack(i));
        auto store = SongPageStore::fromTracks(tracks);

        QVERIFY(store->remove(3));
        QVERIFY(store->remove(4));
        QVERIFY(!store->remove(4));

        const auto page = store->page(0);
        QCOMPARE(page.size(), 8);
        QCOMPARE(page.at(2).id, QStringLiteral("id2"));
        QCOMPARE(page.at(3).id, QStringLiteral("id5"));
        QVERIFY(!store->getByPosition(3).ok);
    }

    void at_countsOccupiedPositionsOnly()
    {
        auto store = SongPageStore::fromTracks({makeTrack(0), makeTrack(1), makeTrack(2), makeTrack(3)});
        QVERIFY(store->remove(1));

        QCOMPARE(store->at(0).value.id, QStringLiteral("id0"));
        QCOMPARE(store->at(1).value.id, QStringLiteral("id2"));
        QCOMPARE(store->at(2).value.id, QStringLiteral("id3"));

        auto past = store->at(3);
        QVERIFY(!past.ok);
        QCOMPARE(past.error.category, ErrorCategory::NotFound);
        QVERIFY(!store->at(-1).ok);
    }
};

QTEST_MAIN(tst_SongPageStore)
#include "tst_SongPageStore.moc"
