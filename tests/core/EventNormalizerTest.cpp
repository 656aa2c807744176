#include <QtTest/QtTest>

#include "whenami/core/EventNormalizer.hpp"

using namespace whenami;
using namespace whenami::core;

namespace {
QDateTime utc(int year, int month, int day, int hour = 0, int minute = 0)
{
    return QDateTime(QDate(year, month, day), QTime(hour, minute), Qt::UTC);
}

data::SourceEvent timedEvent(const QString &title, const QDateTime &start, const QDateTime &end)
{
    data::SourceEvent event;
    event.id = title;
    event.calendarId = QStringLiteral("cal");
    event.title = title;
    event.start = start;
    event.end = end;
    return event;
}
} // namespace

class EventNormalizerTest : public QObject
{
    Q_OBJECT

private slots:
    void allDayUsesSourceZoneMidnight();
    void allDaySpanningDstChange();
    void timedEventWithZoneConvertsToUtc();
    void floatingTimeUsesSourceZone();
    void floatingTimeWithoutZoneIsMalformed();
    void negativeDurationIsMalformed();
    void zeroLengthIsValid();
    void keepsSubMinutePrecision();
    void normalizeCalendarSkipsMalformedEvents();
};

void EventNormalizerTest::allDayUsesSourceZoneMidnight()
{
    data::SourceEvent event;
    event.title = QStringLiteral("Offsite");
    event.start = QDateTime(QDate(2025, 3, 10), QTime(0, 0), Qt::UTC);
    event.sourceTimezone = QTimeZone("America/Los_Angeles");
    event.isAllDay = true;

    const auto interval = EventNormalizer::normalize(event);
    QVERIFY(interval.has_value());
    QCOMPARE(interval->range.start.timeSpec(), Qt::UTC);
    // Los Angeles is already on PDT (UTC-7) by 2025-03-10.
    QCOMPARE(interval->range.start, utc(2025, 3, 10, 7));
    QCOMPARE(interval->range.end, utc(2025, 3, 11, 7));

    event.start = QDateTime(QDate(2025, 3, 7), QTime(0, 0), Qt::UTC);
    const auto winterDay = EventNormalizer::normalize(event);
    QVERIFY(winterDay.has_value());
    QCOMPARE(winterDay->range.start, utc(2025, 3, 7, 8));
    QCOMPARE(winterDay->range.end, utc(2025, 3, 8, 8));
}

void EventNormalizerTest::allDaySpanningDstChange()
{
    // Exclusive end date; LA switches to PDT on 2025-03-09.
    data::SourceEvent event;
    event.start = QDateTime(QDate(2025, 3, 8), QTime(0, 0), Qt::UTC);
    event.end = QDateTime(QDate(2025, 3, 10), QTime(0, 0), Qt::UTC);
    event.sourceTimezone = QTimeZone("America/Los_Angeles");
    event.isAllDay = true;

    const auto interval = EventNormalizer::normalize(event);
    QVERIFY(interval.has_value());
    QCOMPARE(interval->range.start, utc(2025, 3, 8, 8));
    QCOMPARE(interval->range.end, utc(2025, 3, 10, 7));
}

void EventNormalizerTest::timedEventWithZoneConvertsToUtc()
{
    const QTimeZone newYork("America/New_York");
    const auto event = timedEvent(QStringLiteral("Call"), QDateTime(QDate(2025, 6, 1), QTime(14, 0), newYork),
                                  QDateTime(QDate(2025, 6, 1), QTime(15, 0), newYork));

    const auto interval = EventNormalizer::normalize(event);
    QVERIFY(interval.has_value());
    QCOMPARE(interval->range.start, utc(2025, 6, 1, 18));
    QCOMPARE(interval->range.end, utc(2025, 6, 1, 19));
    QCOMPARE(interval->contributors.size(), 1);
    QCOMPARE(interval->contributors.front().title, QStringLiteral("Call"));
}

void EventNormalizerTest::floatingTimeUsesSourceZone()
{
    auto event = timedEvent(QStringLiteral("Dinner"), QDateTime(QDate(2025, 6, 1), QTime(19, 30), Qt::LocalTime),
                            QDateTime(QDate(2025, 6, 1), QTime(20, 0), Qt::LocalTime));
    event.sourceTimezone = QTimeZone("Europe/London");

    const auto interval = EventNormalizer::normalize(event);
    QVERIFY(interval.has_value());
    QCOMPARE(interval->range.start, utc(2025, 6, 1, 18, 30));
    QCOMPARE(interval->range.end, utc(2025, 6, 1, 19));
}

void EventNormalizerTest::floatingTimeWithoutZoneIsMalformed()
{
    const auto event = timedEvent(QStringLiteral("Dinner"),
                                  QDateTime(QDate(2025, 6, 1), QTime(19, 30), Qt::LocalTime),
                                  QDateTime(QDate(2025, 6, 1), QTime(20, 0), Qt::LocalTime));
    EngineError error;
    QVERIFY(!EventNormalizer::normalize(event, &error).has_value());
    QCOMPARE(error.code, ErrorCode::MalformedEvent);
}

void EventNormalizerTest::negativeDurationIsMalformed()
{
    const auto event = timedEvent(QStringLiteral("Backwards"), utc(2025, 6, 1, 11), utc(2025, 6, 1, 10));
    EngineError error;
    QVERIFY(!EventNormalizer::normalize(event, &error).has_value());
    QCOMPARE(error.code, ErrorCode::MalformedEvent);
    QVERIFY(error.message.contains(QStringLiteral("Backwards")));
}

void EventNormalizerTest::zeroLengthIsValid()
{
    const auto event = timedEvent(QStringLiteral("Reminder"), utc(2025, 6, 1, 10), utc(2025, 6, 1, 10));
    const auto interval = EventNormalizer::normalize(event);
    QVERIFY(interval.has_value());
    QVERIFY(interval->range.isEmpty());
    QVERIFY(interval->range.isValid());
}

void EventNormalizerTest::keepsSubMinutePrecision()
{
    const QDateTime start = utc(2025, 6, 1, 10).addMSecs(12'250);
    const auto event = timedEvent(QStringLiteral("Precise"), start, start.addSecs(90));
    const auto interval = EventNormalizer::normalize(event);
    QVERIFY(interval.has_value());
    QCOMPARE(interval->range.start.toMSecsSinceEpoch(), start.toMSecsSinceEpoch());
    QCOMPARE(interval->range.durationSecs(), static_cast<qint64>(90));
}

void EventNormalizerTest::normalizeCalendarSkipsMalformedEvents()
{
    data::CalendarSnapshot snapshot;
    snapshot.calendarId = QStringLiteral("work@example.com");
    snapshot.calendarName = QStringLiteral("Work");
    snapshot.nativeTimezone = QTimeZone("Europe/Berlin");

    data::SourceEvent good;
    good.title = QStringLiteral("Planning");
    good.start = QDateTime(QDate(2025, 6, 2), QTime(10, 0), Qt::LocalTime);
    good.end = QDateTime(QDate(2025, 6, 2), QTime(11, 0), Qt::LocalTime);
    data::SourceEvent broken = good;
    broken.title = QStringLiteral("Broken");
    broken.end = good.start.addSecs(-60);
    snapshot.events = {good, broken};

    const NormalizedCalendar result = EventNormalizer::normalizeCalendar(snapshot);
    QCOMPARE(result.intervals.size(), 1);
    QCOMPARE(result.intervals.front().range.start, utc(2025, 6, 2, 8));
    QCOMPARE(result.intervals.front().contributors.front().calendarId, QStringLiteral("work@example.com"));
    QCOMPARE(result.intervals.front().contributors.front().calendarName, QStringLiteral("Work"));

    QCOMPARE(result.warnings.size(), 1);
    QCOMPARE(result.warnings.front().calendarId, QStringLiteral("work@example.com"));
    QCOMPARE(result.warnings.front().eventTitle, QStringLiteral("Broken"));
}

QTEST_GUILESS_MAIN(EventNormalizerTest)
#include "EventNormalizerTest.moc"
