#include <QtTest/QtTest>

#include "chronix/config/BlockCalendar.hpp"
#include "chronix/core/AppContext.hpp"

using namespace chronix;

namespace {
const QDate kMonday(2026, 1, 5);

QDateTime utc(int hour, int minute = 0)
{
    return QDateTime(kMonday, QTime(hour, minute), Qt::UTC);
}

config::TimeBlockRule rule(const QTime &start, const QTime &end, data::BlockKind kind, const QString &label)
{
    config::TimeBlockRule result;
    result.startTime = start;
    result.endTime = end;
    result.kind = kind;
    result.label = label;
    return result;
}

config::Settings officeSettings()
{
    config::Settings settings;
    settings.scheduling().breaks.push_back(rule(QTime(12, 0), QTime(13, 0), data::BlockKind::Break, QStringLiteral("Lunch")));
    config::TimeBlockRule standup = rule(QTime(9, 0), QTime(9, 30), data::BlockKind::Meeting, QStringLiteral("Standup"));
    standup.days = QStringList{ QStringLiteral("tuesday") };
    settings.scheduling().meetings.push_back(standup);
    return settings;
}

data::ProjectTodoList officeProject()
{
    data::TaskFields report;
    report.title = QStringLiteral("Report");
    report.estimatedDurationMSecs = 2 * 60 * 60 * 1000;
    data::TaskFields review;
    review.title = QStringLiteral("Review");
    review.estimatedDurationMSecs = 2 * 60 * 60 * 1000;
    return data::ProjectTodoList(QStringLiteral("Office"), { data::makeTask(report), data::makeTask(review) });
}
} // namespace

class AppContextTest : public QObject
{
    Q_OBJECT

private slots:
    void planningStartsAtWorkStart();
    void planningStartConvertsToConfiguredZone();
    void scheduleTodayHonoursBreaks();
    void scheduleDaysCoversRequestedRange();
    void loadsTaskFiles();
    void explainsQueuePosition();
    void rejectsUnknownTimezone();
};

void AppContextTest::planningStartsAtWorkStart()
{
    const core::AppContext context(officeSettings());
    QCOMPARE(context.planningStart(utc(7)), utc(9));
    QCOMPARE(context.planningStart(utc(10, 15)), utc(10, 15));
}

void AppContextTest::planningStartConvertsToConfiguredZone()
{
    config::Settings settings;
    settings.scheduling().timezone = QStringLiteral("UTC+02:00");
    const core::AppContext context(settings);

    const QDateTime early = context.planningStart(utc(5));
    QCOMPARE(early.toUTC(), utc(7));
    QCOMPARE(early.time(), QTime(9, 0));

    const QDateTime later = context.planningStart(utc(10, 30));
    QCOMPARE(later.time(), QTime(12, 30));
    QCOMPARE(later.date(), kMonday);
}

void AppContextTest::scheduleTodayHonoursBreaks()
{
    core::AppContext context(officeSettings());
    context.addProject(officeProject());
    QCOMPARE(context.projects().size(), std::size_t(1));

    const data::DaySchedule today = context.scheduleToday(utc(8));
    QCOMPARE(today.date, kMonday);
    QCOMPARE(today.scheduledTasks.size(), std::size_t(3));

    QCOMPARE(today.scheduledTasks[0].task().title(), QStringLiteral("Report"));
    QCOMPARE(today.scheduledTasks[0].task().project(), QStringLiteral("Office"));
    QCOMPARE(today.scheduledTasks[0].start(), utc(9));
    QCOMPARE(today.scheduledTasks[0].end(), utc(11));

    QCOMPARE(today.scheduledTasks[1].task().title(), QStringLiteral("Review"));
    QCOMPARE(today.scheduledTasks[1].start(), utc(11));
    QCOMPARE(today.scheduledTasks[1].end(), utc(12));
    QCOMPARE(today.scheduledTasks[2].start(), utc(13));
    QCOMPARE(today.scheduledTasks[2].end(), utc(14));
    QCOMPARE(today.scheduledTasks[2].segmentIndex(), 2);

    // Only Monday's rules apply; the Tuesday standup is absent.
    QCOMPARE(today.blockedTime.size(), std::size_t(1));
    QCOMPARE(today.blockedTime.front().label(), QStringLiteral("Lunch"));
    QVERIFY(today.conflicts.isEmpty());
}

void AppContextTest::scheduleDaysCoversRequestedRange()
{
    core::AppContext context(officeSettings());
    context.addProject(officeProject());

    const std::vector<data::DaySchedule> days = context.scheduleDays(utc(8), 2);
    QCOMPARE(days.size(), std::size_t(2));
    QCOMPARE(days[0].date, kMonday);
    QCOMPARE(days[0].scheduledTasks.size(), std::size_t(3));
    QVERIFY(days[1].scheduledTasks.empty());

    QCOMPARE(days[1].blockedTime.size(), std::size_t(2));
    QVERIFY_EXCEPTION_THROWN(context.scheduleDays(utc(8), 0), std::invalid_argument);
}

void AppContextTest::loadsTaskFiles()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("office.md"));
    {
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Text));
        file.write("# Office\n"
                   "- [ ] Expenses ::: 30minutes ; 2026-01-05T10:00Z ; -\n"
                   "- [ ] Inbox zero ::: 1hour ; - ; -\n");
    }

    core::AppContext context;
    const int loaded = context.loadTaskFiles({ path, dir.filePath(QStringLiteral("missing.md")) });
    QCOMPARE(loaded, 1);
    QCOMPARE(context.projects().size(), std::size_t(1));

    const std::vector<data::TaskPtr> ordered = context.prioritizedTasks();
    QCOMPARE(ordered.size(), std::size_t(2));
    QCOMPARE(ordered.front()->title(), QStringLiteral("Expenses"));
    QCOMPARE(ordered.front()->project(), QStringLiteral("Office"));
}

void AppContextTest::explainsQueuePosition()
{
    data::TaskFields inbox;
    inbox.id = QStringLiteral("inbox");
    inbox.title = QStringLiteral("Inbox zero");
    inbox.estimatedDurationMSecs = 60 * 60 * 1000;
    data::TaskFields expenses;
    expenses.id = QStringLiteral("expenses");
    expenses.title = QStringLiteral("Expenses");
    expenses.estimatedDurationMSecs = 30 * 60 * 1000;
    expenses.externalDeadline = utc(10);
    data::TaskFields archive;
    archive.id = QStringLiteral("archive");
    archive.title = QStringLiteral("Archive");
    archive.estimatedDurationMSecs = 15 * 60 * 1000;
    archive.completed = true;

    core::AppContext context;
    context.addProject(data::ProjectTodoList(
        QStringLiteral("Office"), { data::makeTask(inbox), data::makeTask(archive), data::makeTask(expenses) }));

    const std::optional<core::TaskExplanation> first = context.explainTask(QStringLiteral("expenses"));
    QVERIFY(first.has_value());
    QCOMPARE(first->task->title(), QStringLiteral("Expenses"));
    QCOMPARE(first->task->project(), QStringLiteral("Office"));
    QCOMPARE(first->project.projectName, QStringLiteral("Office"));
    QCOMPARE(first->position, 1);
    QCOMPARE(first->queueLength, 2);

    const std::optional<core::TaskExplanation> second = context.explainTask(QStringLiteral("inbox"));
    QVERIFY(second.has_value());
    QCOMPARE(second->position, 2);

    const std::optional<core::TaskExplanation> done = context.explainTask(QStringLiteral("archive"));
    QVERIFY(done.has_value());
    QVERIFY(done->task->completed());
    QCOMPARE(done->position, 0);
    QCOMPARE(done->queueLength, 2);

    QVERIFY(!context.explainTask(QStringLiteral("missing")).has_value());
}

void AppContextTest::rejectsUnknownTimezone()
{
    config::Settings settings;
    settings.scheduling().timezone = QStringLiteral("Mars/Olympus_Mons");
    QVERIFY_EXCEPTION_THROWN(core::AppContext context(settings), config::ConfigError);
}

QTEST_GUILESS_MAIN(AppContextTest)
#include "AppContextTest.moc"
