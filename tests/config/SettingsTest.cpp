#include <QtTest/QtTest>

#include "chronix/config/BlockCalendar.hpp"
#include "chronix/config/Settings.hpp"

#include <memory>

using namespace chronix;

namespace {
void writeFile(const QString &path, const QByteArray &contents)
{
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Text));
    file.write(contents);
}
} // namespace

class SettingsTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void missingFileGivesDefaults();
    void loadsSchedulingSection();
    void rejectsInvalidValues_data();
    void rejectsInvalidValues();
    void saveThenLoad();
    void initialSettingsAddWeekdayLunch();
    void calendarExpandsRulesPerWeekday();
    void calendarUsesConfiguredZone();
    void calendarSkipsRulesWithoutInterval();
    void calendarSurvivesDaylightSavingGap();

private:
    std::unique_ptr<QTemporaryDir> m_dir;
};

void SettingsTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

void SettingsTest::missingFileGivesDefaults()
{
    const config::Settings settings = config::Settings::load(m_dir->filePath(QStringLiteral("absent.ini")));
    const config::SchedulingSettings &scheduling = settings.scheduling();
    QCOMPARE(scheduling.workStart, QTime(9, 0));
    QCOMPARE(scheduling.workEnd, QTime(18, 0));
    QCOMPARE(scheduling.timezone, QStringLiteral("UTC"));
    QCOMPARE(scheduling.defaultTaskDurationMinutes, 60);
    QVERIFY(scheduling.allRules().empty());
}

void SettingsTest::loadsSchedulingSection()
{
    const QString path = m_dir->filePath(QStringLiteral("config.ini"));
    writeFile(path, "[scheduling]\n"
                    "work_start=08:30\n"
                    "work_end=17:00\n"
                    "timezone=UTC+01:00\n"
                    "default_task_duration_minutes=45\n"
                    "\n"
                    "[sleep]\n"
                    "size=1\n"
                    "1\\start=23:00\n"
                    "1\\end=23:59\n"
                    "\n"
                    "[breaks]\n"
                    "size=1\n"
                    "1\\start=12:00\n"
                    "1\\end=12:45\n"
                    "1\\label=Lunch\n"
                    "\n"
                    "[meetings]\n"
                    "size=2\n"
                    "1\\start=10:00\n"
                    "1\\end=10:30\n"
                    "1\\label=Planning\n"
                    "1\\days=monday, thursday\n"
                    "2\\start=15:00\n"
                    "2\\end=16:00\n"
                    "2\\kind=blocked\n"
                    "2\\label=Focus\n");

    const config::Settings settings = config::Settings::load(path);
    const config::SchedulingSettings &scheduling = settings.scheduling();
    QCOMPARE(scheduling.workStart, QTime(8, 30));
    QCOMPARE(scheduling.workEnd, QTime(17, 0));
    QCOMPARE(scheduling.timezone, QStringLiteral("UTC+01:00"));
    QCOMPARE(scheduling.defaultTaskDurationMinutes, 45);

    QCOMPARE(scheduling.sleepWindows.size(), std::size_t(1));
    QVERIFY(scheduling.sleepWindows.front().kind == data::BlockKind::Sleep);
    QCOMPARE(scheduling.sleepWindows.front().days, config::TimeBlockRule::allDays());

    QCOMPARE(scheduling.breaks.size(), std::size_t(1));
    QVERIFY(scheduling.breaks.front().kind == data::BlockKind::Break);
    QCOMPARE(scheduling.breaks.front().label, QStringLiteral("Lunch"));

    QCOMPARE(scheduling.meetings.size(), std::size_t(2));
    const config::TimeBlockRule &planning = scheduling.meetings[0];
    QVERIFY(planning.kind == data::BlockKind::Meeting);
    QCOMPARE(planning.days, QStringList({ QStringLiteral("monday"), QStringLiteral("thursday") }));
    QVERIFY(planning.appliesTo(Qt::Monday));
    QVERIFY(!planning.appliesTo(Qt::Tuesday));
    QVERIFY(scheduling.meetings[1].kind == data::BlockKind::Blocked);
    QCOMPARE(scheduling.allRules().size(), std::size_t(4));
}

void SettingsTest::rejectsInvalidValues_data()
{
    QTest::addColumn<QByteArray>("contents");

    QTest::newRow("bad time") << QByteArray("[scheduling]\nwork_start=nine\n");
    QTest::newRow("inverted work hours") << QByteArray("[scheduling]\nwork_start=18:00\nwork_end=09:00\n");
    QTest::newRow("unknown timezone") << QByteArray("[scheduling]\ntimezone=Nowhere/Special\n");
    QTest::newRow("duration not a number") << QByteArray("[scheduling]\ndefault_task_duration_minutes=soon\n");
    QTest::newRow("duration zero") << QByteArray("[scheduling]\ndefault_task_duration_minutes=0\n");
    QTest::newRow("unknown kind") << QByteArray("[meetings]\nsize=1\n1\\start=10:00\n1\\end=11:00\n1\\kind=nap\n");
    QTest::newRow("unknown day") << QByteArray("[breaks]\nsize=1\n1\\start=12:00\n1\\end=13:00\n1\\days=funday\n");
    QTest::newRow("inverted block") << QByteArray("[breaks]\nsize=1\n1\\start=13:00\n1\\end=12:00\n");
}

void SettingsTest::rejectsInvalidValues()
{
    QFETCH(QByteArray, contents);
    const QString path = m_dir->filePath(QStringLiteral("broken.ini"));
    writeFile(path, contents);
    QVERIFY_EXCEPTION_THROWN(config::Settings::load(path), config::ConfigError);
}

void SettingsTest::saveThenLoad()
{
    config::Settings settings;
    settings.scheduling().workStart = QTime(7, 45);
    settings.scheduling().timezone = QStringLiteral("UTC-05:00");
    config::TimeBlockRule gym;
    gym.startTime = QTime(18, 0);
    gym.endTime = QTime(19, 30);
    gym.kind = data::BlockKind::Blocked;
    gym.label = QStringLiteral("Gym");
    gym.days = QStringList{ QStringLiteral("wednesday") };
    settings.scheduling().meetings.push_back(gym);

    const QString path = m_dir->filePath(QStringLiteral("nested/dir/config.ini"));
    QVERIFY(settings.save(path));

    const config::Settings loaded = config::Settings::load(path);
    QCOMPARE(loaded.scheduling().workStart, QTime(7, 45));
    QCOMPARE(loaded.scheduling().timezone, QStringLiteral("UTC-05:00"));
    QCOMPARE(loaded.scheduling().meetings.size(), std::size_t(1));
    const config::TimeBlockRule &restored = loaded.scheduling().meetings.front();
    QCOMPARE(restored.startTime, QTime(18, 0));
    QCOMPARE(restored.endTime, QTime(19, 30));
    QVERIFY(restored.kind == data::BlockKind::Blocked);
    QCOMPARE(restored.label, QStringLiteral("Gym"));
    QCOMPARE(restored.days, QStringList{ QStringLiteral("wednesday") });
}

void SettingsTest::initialSettingsAddWeekdayLunch()
{
    const config::Settings initial = config::Settings::initial();
    QCOMPARE(initial.scheduling().breaks.size(), std::size_t(1));
    const config::TimeBlockRule &lunch = initial.scheduling().breaks.front();
    QCOMPARE(lunch.label, QStringLiteral("Lunch"));
    QVERIFY(lunch.appliesTo(Qt::Friday));
    QVERIFY(!lunch.appliesTo(Qt::Saturday));
    initial.validate();

    const QString path = m_dir->filePath(QStringLiteral("config.ini"));
    QVERIFY(initial.save(path));
    const config::Settings loaded = config::Settings::load(path);
    QCOMPARE(loaded.scheduling().breaks.size(), std::size_t(1));
    QCOMPARE(loaded.scheduling().breaks.front().days.size(), 5);
    QCOMPARE(loaded.scheduling().workStart, QTime(9, 0));
}

void SettingsTest::calendarExpandsRulesPerWeekday()
{
    config::Settings settings;
    config::TimeBlockRule lunch;
    lunch.startTime = QTime(12, 0);
    lunch.endTime = QTime(13, 0);
    lunch.kind = data::BlockKind::Break;
    settings.scheduling().breaks.push_back(lunch);
    config::TimeBlockRule review = lunch;
    review.startTime = QTime(16, 0);
    review.endTime = QTime(17, 0);
    review.kind = data::BlockKind::Meeting;
    review.days = QStringList{ QStringLiteral("friday") };
    settings.scheduling().meetings.push_back(review);

    const config::BlockCalendar calendar(settings);
    const QDate monday(2026, 1, 5);
    const QDate friday(2026, 1, 9);

    const std::vector<data::TimeBlock> mondayBlocks = calendar.blocksForDate(monday);
    QCOMPARE(mondayBlocks.size(), std::size_t(1));
    QCOMPARE(mondayBlocks.front().start(), QDateTime(monday, QTime(12, 0), Qt::UTC));

    const std::vector<data::TimeBlock> fridayBlocks = calendar.blocksForDate(friday);
    QCOMPARE(fridayBlocks.size(), std::size_t(2));
    QVERIFY(fridayBlocks.back().kind() == data::BlockKind::Meeting);
}

void SettingsTest::calendarUsesConfiguredZone()
{
    config::Settings settings;
    settings.scheduling().timezone = QStringLiteral("UTC+03:00");
    const config::BlockCalendar calendar(settings);

    const QDate monday(2026, 1, 5);
    const std::pair<QDateTime, QDateTime> window = calendar.workWindow(monday);
    QCOMPARE(window.first.toUTC(), QDateTime(monday, QTime(6, 0), Qt::UTC));
    QCOMPARE(window.second.toUTC(), QDateTime(monday, QTime(15, 0), Qt::UTC));
    QCOMPARE(window.first.timeSpec(), Qt::TimeZone);
}

void SettingsTest::calendarSkipsRulesWithoutInterval()
{
    config::Settings settings;
    config::TimeBlockRule unset;
    unset.kind = data::BlockKind::Meeting;
    unset.label = QStringLiteral("Unset");
    settings.scheduling().meetings.push_back(unset);
    config::TimeBlockRule lunch;
    lunch.startTime = QTime(12, 0);
    lunch.endTime = QTime(13, 0);
    lunch.kind = data::BlockKind::Break;
    settings.scheduling().breaks.push_back(lunch);

    const config::BlockCalendar calendar(settings);
    std::vector<data::TimeBlock> blocks;
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("Skipping .*Unset")));
    blocks = calendar.blocksForDate(QDate(2026, 1, 5));
    QCOMPARE(blocks.size(), std::size_t(1));
    QVERIFY(blocks.front().kind() == data::BlockKind::Break);
}

void SettingsTest::calendarSurvivesDaylightSavingGap()
{
    if (!QTimeZone::isTimeZoneIdAvailable("Europe/Vienna")) {
        QSKIP("Europe/Vienna is not in the zone database");
    }
    config::Settings settings;
    settings.scheduling().timezone = QStringLiteral("Europe/Vienna");
    config::TimeBlockRule early;
    early.startTime = QTime(2, 30);
    early.endTime = QTime(3, 30);
    early.kind = data::BlockKind::Sleep;
    settings.scheduling().sleepWindows.push_back(early);

    const config::BlockCalendar calendar(settings);
    // 02:00-03:00 does not exist in Vienna on this date.
    const QDate springForward(2026, 3, 29);
    std::vector<data::TimeBlock> blocks;
    try {
        blocks = calendar.blocksForDate(springForward);
    } catch (const std::exception &error) {
        QFAIL(error.what());
    }
    QVERIFY(blocks.size() <= std::size_t(1));
    for (const data::TimeBlock &block : blocks) {
        QVERIFY(block.start() < block.end());
    }

    QCOMPARE(calendar.blocksForDate(springForward.addDays(1)).size(), std::size_t(1));
}

QTEST_GUILESS_MAIN(SettingsTest)
#include "SettingsTest.moc"
