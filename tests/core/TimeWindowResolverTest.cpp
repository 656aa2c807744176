#include <QtTest/QtTest>

#include "whenami/core/TimeWindowResolver.hpp"

using namespace whenami::core;

namespace {
QDateTime utc(int year, int month, int day, int hour = 0, int minute = 0)
{
    return QDateTime(QDate(year, month, day), QTime(hour, minute), Qt::UTC);
}

QTimeZone zone(const char *id)
{
    return QTimeZone(QByteArray(id));
}
} // namespace

class TimeWindowResolverTest : public QObject
{
    Q_OBJECT

private slots:
    void todayUsesResolverZoneMidnight();
    void tomorrowIsNextLocalDay();
    void nextWeekStartsAtNextWeekStart();
    void nextWeekOnWeekStartSkipsToFollowingWeek();
    void nextWeekHonoursConfiguredWeekStart();
    void nextWeekWorkDaysOnly();
    void nextTwoWeeks();
    void parsesDateFormats_data();
    void parsesDateFormats();
    void rejectsInvalidDates_data();
    void rejectsInvalidDates();
    void dateRangeExpandsInclusive();
    void dateRangeRejectsReversedRange();
    void dstDaysHaveLocalLength();
    void invalidZoneIsRejected();
    void isDeterministic();
};

void TimeWindowResolverTest::todayUsesResolverZoneMidnight()
{
    // 03:00 UTC is still the previous evening in New York.
    const TimeWindowResolver resolver;
    const auto window = resolver.resolve(DateSelector::today(), utc(2025, 6, 1, 3), zone("America/New_York"));
    QVERIFY(window.has_value());
    QCOMPARE(window->range.start, utc(2025, 5, 31, 4));
    QCOMPARE(window->range.end, utc(2025, 6, 1, 4));
    QCOMPARE(window->days.size(), 1);
    QCOMPARE(window->days.front().date, QDate(2025, 5, 31));
}

void TimeWindowResolverTest::tomorrowIsNextLocalDay()
{
    const TimeWindowResolver resolver;
    const auto window = resolver.resolve(DateSelector::tomorrow(), utc(2025, 6, 1, 12), zone("Europe/Berlin"));
    QVERIFY(window.has_value());
    QCOMPARE(window->range.start, utc(2025, 6, 1, 22));
    QCOMPARE(window->range.end, utc(2025, 6, 2, 22));
    QCOMPARE(window->days.front().date, QDate(2025, 6, 2));
}

void TimeWindowResolverTest::nextWeekStartsAtNextWeekStart()
{
    // 2025-06-04 is a Wednesday.
    const TimeWindowResolver resolver;
    const auto window = resolver.resolve(DateSelector::nextWeek(), utc(2025, 6, 4, 10), QTimeZone::utc());
    QVERIFY(window.has_value());
    QCOMPARE(window->days.size(), 7);
    QCOMPARE(window->days.front().date, QDate(2025, 6, 9));
    QCOMPARE(window->days.back().date, QDate(2025, 6, 15));
    QCOMPARE(window->range.start, utc(2025, 6, 9));
    QCOMPARE(window->range.end, utc(2025, 6, 16));
}

void TimeWindowResolverTest::nextWeekOnWeekStartSkipsToFollowingWeek()
{
    const TimeWindowResolver resolver;
    const auto window = resolver.resolve(DateSelector::nextWeek(), utc(2025, 6, 9, 10), QTimeZone::utc());
    QVERIFY(window.has_value());
    QCOMPARE(window->days.front().date, QDate(2025, 6, 16));
}

void TimeWindowResolverTest::nextWeekHonoursConfiguredWeekStart()
{
    const TimeWindowResolver resolver(Qt::Sunday);
    const auto window = resolver.resolve(DateSelector::nextWeek(), utc(2025, 6, 4, 10), QTimeZone::utc());
    QVERIFY(window.has_value());
    QCOMPARE(window->days.front().date, QDate(2025, 6, 8));
    QCOMPARE(window->days.front().date.dayOfWeek(), static_cast<int>(Qt::Sunday));
}

void TimeWindowResolverTest::nextWeekWorkDaysOnly()
{
    const TimeWindowResolver resolver(Qt::Monday, true);
    const auto window = resolver.resolve(DateSelector::nextWeek(), utc(2025, 6, 4, 10), QTimeZone::utc());
    QVERIFY(window.has_value());
    QCOMPARE(window->days.size(), 5);
    for (const auto &day : window->days) {
        QVERIFY(day.date.dayOfWeek() <= Qt::Friday);
    }
    QCOMPARE(window->days.back().date, QDate(2025, 6, 13));
}

void TimeWindowResolverTest::nextTwoWeeks()
{
    const TimeWindowResolver resolver;
    const auto window = resolver.resolve(DateSelector::nextTwoWeeks(), utc(2025, 6, 4, 10), QTimeZone::utc());
    QVERIFY(window.has_value());
    QCOMPARE(window->days.size(), 14);
    QCOMPARE(window->days.front().date, QDate(2025, 6, 4));
    QCOMPARE(window->range.end, utc(2025, 6, 18));
}

void TimeWindowResolverTest::parsesDateFormats_data()
{
    QTest::addColumn<QString>("text");
    QTest::addColumn<QDate>("expected");

    QTest::newRow("slash-long") << QStringLiteral("10/03/2025") << QDate(2025, 3, 10);
    QTest::newRow("slash-short") << QStringLiteral("10/03/25") << QDate(2025, 3, 10);
    QTest::newRow("dash-long") << QStringLiteral("10-03-2025") << QDate(2025, 3, 10);
    QTest::newRow("dash-short") << QStringLiteral("10-03-25") << QDate(2025, 3, 10);
    QTest::newRow("single-digits") << QStringLiteral("1/3/2025") << QDate(2025, 3, 1);
    QTest::newRow("mixed-separators") << QStringLiteral("01/03-2025") << QDate(2025, 3, 1);
    QTest::newRow("short-year-pivot") << QStringLiteral("01/01/70") << QDate(1970, 1, 1);
    QTest::newRow("short-year-below-pivot") << QStringLiteral("01/01/68") << QDate(2068, 1, 1);
}

void TimeWindowResolverTest::parsesDateFormats()
{
    QFETCH(QString, text);
    QFETCH(QDate, expected);

    const auto parsed = TimeWindowResolver::parseDate(text);
    QVERIFY(parsed.has_value());
    QCOMPARE(*parsed, expected);
}

void TimeWindowResolverTest::rejectsInvalidDates_data()
{
    QTest::addColumn<QString>("text");

    QTest::newRow("iso") << QStringLiteral("2025-03-10");
    QTest::newRow("impossible-day") << QStringLiteral("31/02/2025");
    QTest::newRow("words") << QStringLiteral("next tuesday");
    QTest::newRow("empty") << QString();
    QTest::newRow("three-digit-year") << QStringLiteral("10/03/202");
}

void TimeWindowResolverTest::rejectsInvalidDates()
{
    QFETCH(QString, text);

    const TimeWindowResolver resolver;
    EngineError error;
    const auto window = resolver.resolve(DateSelector::date(text), utc(2025, 6, 1), QTimeZone::utc(), &error);
    QVERIFY(!window.has_value());
    QCOMPARE(error.code, ErrorCode::InvalidDateFormat);
    QVERIFY(!error.message.isEmpty());
}

void TimeWindowResolverTest::dateRangeExpandsInclusive()
{
    const TimeWindowResolver resolver;
    const auto window = resolver.resolve(DateSelector::dateRange(QStringLiteral("28/02/2025,02/03/2025")),
                                         utc(2025, 6, 1), zone("Asia/Tokyo"));
    QVERIFY(window.has_value());
    QCOMPARE(window->days.size(), 3);
    QCOMPARE(window->days.at(0).date, QDate(2025, 2, 28));
    QCOMPARE(window->days.at(1).date, QDate(2025, 3, 1));
    QCOMPARE(window->days.at(2).date, QDate(2025, 3, 2));
    QCOMPARE(window->range.start, utc(2025, 2, 27, 15));
    QCOMPARE(window->range.end, utc(2025, 3, 2, 15));
    for (int i = 1; i < window->days.size(); ++i) {
        QCOMPARE(window->days.at(i - 1).range.end, window->days.at(i).range.start);
    }
}

void TimeWindowResolverTest::dateRangeRejectsReversedRange()
{
    const TimeWindowResolver resolver;
    EngineError error;
    const auto window = resolver.resolve(DateSelector::dateRange(QStringLiteral("05/03/2025"), QStringLiteral("01/03/2025")),
                                         utc(2025, 6, 1), QTimeZone::utc(), &error);
    QVERIFY(!window.has_value());
    QCOMPARE(error.code, ErrorCode::InvalidRange);
}

void TimeWindowResolverTest::dstDaysHaveLocalLength()
{
    const TimeWindowResolver resolver;
    const auto springForward = resolver.resolve(DateSelector::date(QStringLiteral("09/03/2025")), utc(2025, 1, 1),
                                                zone("America/Los_Angeles"));
    QVERIFY(springForward.has_value());
    QCOMPARE(springForward->range.start, utc(2025, 3, 9, 8));
    QCOMPARE(springForward->range.end, utc(2025, 3, 10, 7));
    QCOMPARE(springForward->range.durationSecs(), static_cast<qint64>(23 * 3600));

    const auto fallBack = resolver.resolve(DateSelector::date(QStringLiteral("02/11/2025")), utc(2025, 1, 1),
                                           zone("America/Los_Angeles"));
    QVERIFY(fallBack.has_value());
    QCOMPARE(fallBack->range.durationSecs(), static_cast<qint64>(25 * 3600));
}

void TimeWindowResolverTest::isDeterministic()
{
    const TimeWindowResolver resolver;
    const QDateTime now = utc(2025, 6, 4, 10);
    const auto first = resolver.resolve(DateSelector::nextWeek(), now, zone("Europe/London"));
    const auto second = resolver.resolve(DateSelector::nextWeek(), now, zone("Europe/London"));
    QVERIFY(first.has_value() && second.has_value());
    QCOMPARE(first->range, second->range);
    QCOMPARE(first->days.size(), second->days.size());
}

void TimeWindowResolverTest::invalidZoneIsRejected()
{
    const TimeWindowResolver resolver;
    EngineError error;
    QVERIFY(!resolver.resolve(DateSelector::today(), utc(2025, 6, 1, 12), QTimeZone(), &error).has_value());
    QCOMPARE(error.code, ErrorCode::InvalidTimezone);
    QVERIFY(error.isError());
}

QTEST_GUILESS_MAIN(TimeWindowResolverTest)
#include "TimeWindowResolverTest.moc"
