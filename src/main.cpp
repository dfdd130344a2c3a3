#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include "version.h"

#include "recurring/core/EngineSettings.hpp"
#include "recurring/core/RecurrenceExpander.hpp"
#include "recurring/core/RecurrenceRule.hpp"
#include "recurring/core/SeriesAggregator.hpp"
#include "recurring/data/DataProvider.hpp"
#include "recurring/data/IcsExporter.hpp"

using namespace recurring;

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

int reportError(const core::ScheduleError &error)
{
    err() << error.toString() << Qt::endl;
    return 1;
}

int runValidate(const QString &rule)
{
    core::ScheduleError error;
    if (!core::validateRecurrenceRule(rule, &error)) {
        return reportError(error);
    }
    out() << "valid" << Qt::endl;
    return 0;
}

int runDescribe(const QString &rule)
{
    core::ScheduleError error;
    const auto parsed = core::RecurrenceRule::parse(rule, &error);
    if (!parsed) {
        return reportError(error);
    }
    out() << parsed->describe() << Qt::endl;
    return 0;
}

int runExpand(const QString &rule, const QCommandLineParser &parser, const core::EngineSettings &settings)
{
    const QDateTime start = QDateTime::fromString(parser.value(QStringLiteral("start")), Qt::ISODate);
    bool durationOk = false;
    const qint64 duration = parser.value(QStringLiteral("duration")).toLongLong(&durationOk);
    if (!durationOk) {
        err() << "--duration expects a number of seconds" << Qt::endl;
        return 1;
    }
    QDateTime until;
    if (parser.isSet(QStringLiteral("until"))) {
        until = QDateTime::fromString(parser.value(QStringLiteral("until")), Qt::ISODate);
        if (!until.isValid()) {
            err() << "--until expects an ISO 8601 date-time" << Qt::endl;
            return 1;
        }
    } else if (start.isValid()) {
        until = start.addDays(settings.horizonDays);
    }

    core::RecurrenceExpander expander(settings.maxOccurrences);
    core::ScheduleError error;
    const auto occurrences = expander.expand(rule, start, duration, parser.value(QStringLiteral("timezone")).toUtf8(),
                                             until, &error);
    if (!occurrences) {
        return reportError(error);
    }
    for (const core::Occurrence &occurrence : *occurrences) {
        out() << occurrence.localDate.toString(Qt::ISODate) << '\t' << occurrence.range.toString() << Qt::endl;
    }
    return 0;
}

void printSummary(const core::GroupSummary &summary)
{
    out() << '#' << summary.group.id << ' ' << summary.group.displayName << " ["
          << core::groupStatusToString(summary.status) << "]" << Qt::endl;
    out() << "  versions: " << summary.versionCount << ", started: " << summary.startedOn.toString(Qt::ISODate)
          << ", record type: " << summary.recordType << Qt::endl;
    if (summary.currentVersion) {
        const auto rule = core::RecurrenceRule::parse(summary.currentVersion->rule);
        out() << "  rule: " << (rule ? rule->describe() : summary.currentVersion->rule) << Qt::endl;
    }
    out() << "  active instances: " << summary.activeInstanceCount << ", exceptions: " << summary.exceptionCount
          << Qt::endl;
}

int runSummary(const QCommandLineParser &parser, const core::EngineSettings &settings)
{
    data::DataProvider provider(parser.value(QStringLiteral("store")));
    core::SeriesAggregator aggregator(provider.scheduleRepository(), settings.summaryInstanceLimit);

    if (parser.isSet(QStringLiteral("group"))) {
        core::ScheduleError error;
        const auto summary = aggregator.summarize(parser.value(QStringLiteral("group")).toLongLong(), &error);
        if (!summary) {
            return reportError(error);
        }
        printSummary(*summary);
        return 0;
    }
    for (const core::GroupSummary &summary : aggregator.summarizeAll()) {
        printSummary(summary);
    }
    return 0;
}

int runExportIcs(const QCommandLineParser &parser)
{
    if (!parser.isSet(QStringLiteral("group"))) {
        err() << "export-ics requires --group" << Qt::endl;
        return 1;
    }
    const qint64 groupId = parser.value(QStringLiteral("group")).toLongLong();
    data::DataProvider provider(parser.value(QStringLiteral("store")));
    data::IcsExporter exporter(provider.scheduleRepository());

    if (parser.isSet(QStringLiteral("output"))) {
        if (!exporter.writeGroup(groupId, parser.value(QStringLiteral("output")))) {
            err() << "Could not export group " << groupId << Qt::endl;
            return 1;
        }
        return 0;
    }
    const QString document = exporter.exportGroup(groupId);
    if (document.isEmpty()) {
        err() << "Group " << groupId << " not found" << Qt::endl;
        return 1;
    }
    out() << document;
    out().flush();
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Zellhoff"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("zellhoff.at"));
    QCoreApplication::setApplicationName(QStringLiteral("Recurring Schedule"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kRecurringScheduleVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Inspect recurrence rules and stored schedules."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("validate, describe, expand, summary or export-ics"));
    parser.addPositionalArgument(QStringLiteral("rule"), QStringLiteral("RRULE value for validate, describe and expand"),
                                 QStringLiteral("[rule]"));
    parser.addOptions({
        {QStringLiteral("store"), QStringLiteral("Schedule file to read."), QStringLiteral("file")},
        {QStringLiteral("start"), QStringLiteral("Anchor start (ISO 8601)."), QStringLiteral("datetime")},
        {QStringLiteral("duration"), QStringLiteral("Occurrence length in seconds."), QStringLiteral("seconds"),
         QStringLiteral("3600")},
        {QStringLiteral("timezone"), QStringLiteral("IANA timezone of the series."), QStringLiteral("zone")},
        {QStringLiteral("until"), QStringLiteral("Inclusive window end (ISO 8601)."), QStringLiteral("datetime")},
        {QStringLiteral("group"), QStringLiteral("Series group id."), QStringLiteral("id")},
        {QStringLiteral("output"), QStringLiteral("File to write the calendar to."), QStringLiteral("file")},
    });
    parser.process(app);

    QSettings settingsStore;
    const core::EngineSettings settings = core::EngineSettings::load(settingsStore);

    const QStringList arguments = parser.positionalArguments();
    if (arguments.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = arguments.first();
    const QString rule = arguments.value(1);

    if (command == QLatin1String("validate") || command == QLatin1String("describe")
        || command == QLatin1String("expand")) {
        if (rule.isEmpty()) {
            err() << command << " requires a rule" << Qt::endl;
            return 1;
        }
        if (command == QLatin1String("validate")) {
            return runValidate(rule);
        }
        if (command == QLatin1String("describe")) {
            return runDescribe(rule);
        }
        return runExpand(rule, parser, settings);
    }
    if (command == QLatin1String("summary")) {
        return runSummary(parser, settings);
    }
    if (command == QLatin1String("export-ics")) {
        return runExportIcs(parser);
    }

    err() << "Unknown command " << command << Qt::endl;
    return 1;
}
