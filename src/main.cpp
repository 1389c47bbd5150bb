#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QFile>
#include <QLoggingCategory>
#include <QString>
#include <QTextStream>

#include <optional>
#include <stdexcept>
#include <vector>

#include "version.h"

#include "chronix/config/BlockCalendar.hpp"
#include "chronix/config/Settings.hpp"
#include "chronix/core/AppContext.hpp"
#include "chronix/ui/ScheduleReport.hpp"

namespace {

constexpr int DEFAULT_SCHEDULE_DAYS = 3;

int runToday(const chronix::core::AppContext &context, const QDateTime &now, QTextStream &out)
{
    const chronix::data::DaySchedule day = context.scheduleToday(now);
    const auto window = context.calendar().workWindow(day.date);

    chronix::ui::ScheduleReport report(out);
    report.printDay(day, context.planningStart(now), window.second);
    report.printConflicts(day.conflicts);
    report.printTotals(day);
    return 0;
}

int runSchedule(const chronix::core::AppContext &context, const QDateTime &now, int numDays, QTextStream &out)
{
    const std::vector<chronix::data::DaySchedule> days = context.scheduleDays(now, numDays);
    const QDateTime start = context.planningStart(now);

    chronix::ui::ScheduleReport report(out);
    QStringList conflicts;
    for (std::size_t i = 0; i < days.size(); ++i) {
        const chronix::data::DaySchedule &day = days[i];
        auto window = context.calendar().workWindow(day.date);
        if (i == 0) {
            window.first = start;
        } else {
            report.printSeparator();
        }
        report.printDay(day, window.first, window.second);
        conflicts << day.conflicts;
    }
    if (!conflicts.isEmpty()) {
        report.printSeparator();
        report.printConflicts(conflicts);
    }
    return 0;
}

int runExplain(const chronix::core::AppContext &context, const QString &taskId, const QDateTime &now,
               QTextStream &out, QTextStream &err)
{
    const std::optional<chronix::core::TaskExplanation> explanation = context.explainTask(taskId);
    if (!explanation) {
        err << "Task with ID '" << taskId << "' not found.\n";
        return 1;
    }

    chronix::ui::ScheduleReport report(out);
    report.printTaskDetails(*explanation->task, explanation->project);
    report.printTaskPosition(*explanation->task, explanation->position, explanation->queueLength,
                             now.toTimeZone(context.calendar().timeZone()));
    return 0;
}

int runConfig(const QString &subcommand, const QString &path, bool force, QTextStream &out, QTextStream &err)
{
    if (subcommand == QLatin1String("path")) {
        out << path << '\n';
        return 0;
    }

    if (subcommand == QLatin1String("init")) {
        if (QFile::exists(path) && !force) {
            err << "Configuration file already exists: " << path << "\nUse --force to overwrite\n";
            return 1;
        }
        const chronix::config::Settings settings = chronix::config::Settings::initial();
        if (!settings.save(path)) {
            err << "Failed to write configuration: " << path << '\n';
            return 1;
        }
        out << "Configuration initialized at: " << path << "\n\n";
        chronix::ui::ScheduleReport(out).printSettings(settings);
        return 0;
    }

    if (subcommand != QLatin1String("show") && subcommand != QLatin1String("validate")) {
        err << "Unknown config subcommand: " << subcommand << "\nAvailable: init, show, path, validate\n";
        return 1;
    }
    if (!QFile::exists(path)) {
        err << "No configuration found at: " << path << "\nRun 'chronix config init' to create one.\n";
        return 1;
    }

    try {
        const chronix::config::Settings settings = chronix::config::Settings::load(path);
        const chronix::config::BlockCalendar calendar(settings);
        if (subcommand == QLatin1String("show")) {
            out << "Configuration: " << path << "\n\n";
            chronix::ui::ScheduleReport(out).printSettings(settings);
            return 0;
        }
        const chronix::config::SchedulingSettings &scheduling = settings.scheduling();
        out << "Configuration is valid: " << path << '\n'
            << "  Sleep windows: " << scheduling.sleepWindows.size() << '\n'
            << "  Breaks: " << scheduling.breaks.size() << '\n'
            << "  Meetings: " << scheduling.meetings.size() << '\n';
        return 0;
    } catch (const chronix::config::ConfigError &error) {
        err << "Configuration is invalid: " << error.what() << '\n';
        return 1;
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("chronix"));
    QCoreApplication::setApplicationName(QStringLiteral("chronix"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kChronixVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Plans prioritized tasks around blocked time."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(QStringList{ QStringLiteral("c"), QStringLiteral("config") },
                                          QStringLiteral("Configuration file (INI)."), QStringLiteral("file"),
                                          chronix::config::Settings::defaultPath());
    const QCommandLineOption nowOption(QStringLiteral("now"),
                                       QStringLiteral("Plan as if the current time were <iso>."), QStringLiteral("iso"));
    const QCommandLineOption daysOption(QStringList{ QStringLiteral("d"), QStringLiteral("days") },
                                        QStringLiteral("Days to plan for the schedule command."), QStringLiteral("n"),
                                        QString::number(DEFAULT_SCHEDULE_DAYS));
    const QCommandLineOption verboseOption(QStringList{ QStringLiteral("v"), QStringLiteral("verbose") },
                                           QStringLiteral("Print debug logging."));
    const QCommandLineOption forceOption(QStringList{ QStringLiteral("f"), QStringLiteral("force") },
                                         QStringLiteral("Let 'config init' overwrite an existing file."));
    parser.addOptions({ configOption, nowOption, daysOption, verboseOption, forceOption });
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("today | schedule | explain <task id> | config <init|show|path|validate>"));
    parser.addPositionalArgument(QStringLiteral("files"), QStringLiteral("Task files, one per project."), QStringLiteral("files..."));
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("chronix.*.debug=true"));
    }

    QStringList arguments = parser.positionalArguments();
    if (arguments.size() < 2) {
        err << "Usage: chronix [options] <today|schedule> <task files...>\n"
               "       chronix [options] explain <task id> <task files...>\n"
               "       chronix [options] config <init|show|path|validate>\n";
        return 1;
    }
    const QString command = arguments.takeFirst();

    if (command == QLatin1String("config")) {
        return runConfig(arguments.first(), parser.value(configOption), parser.isSet(forceOption), out, err);
    }
    QString taskId;
    if (command == QLatin1String("explain")) {
        taskId = arguments.takeFirst();
        if (arguments.isEmpty()) {
            err << "Usage: chronix [options] explain <task id> <task files...>\n";
            return 1;
        }
    }

    QDateTime now = QDateTime::currentDateTimeUtc();
    if (parser.isSet(nowOption)) {
        now = QDateTime::fromString(parser.value(nowOption), Qt::ISODate);
        if (!now.isValid()) {
            err << "Invalid --now value: " << parser.value(nowOption) << '\n';
            return 1;
        }
        if (now.timeSpec() == Qt::LocalTime) {
            now.setTimeSpec(Qt::UTC);
        }
    }

    try {
        chronix::core::AppContext context(chronix::config::Settings::load(parser.value(configOption)));
        if (context.loadTaskFiles(arguments) == 0) {
            err << "No task files could be read.\n";
            return 1;
        }

        if (command == QLatin1String("explain")) {
            return runExplain(context, taskId, now, out, err);
        }
        if (command == QLatin1String("today")) {
            return runToday(context, now, out);
        }
        if (command == QLatin1String("schedule")) {
            bool ok = false;
            const int numDays = parser.value(daysOption).toInt(&ok);
            if (!ok || numDays < 1) {
                err << "Number of days must be a positive integer\n";
                return 1;
            }
            return runSchedule(context, now, numDays, out);
        }
        err << "Unknown command: " << command << '\n';
        return 1;
    } catch (const std::exception &error) {
        err << "Error: " << error.what() << '\n';
        return 1;
    }
}
