#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include <chrono>

#include "version.h"

#include "agenda/analysis/ScheduleAnalyzer.hpp"
#include "agenda/core/Settings.hpp"
#include "agenda/core/ZonedClock.hpp"
#include "agenda/data/Calendar.hpp"
#include "agenda/data/IcsCodec.hpp"
#include "agenda/data/JsonCodec.hpp"

using namespace agenda;

namespace {

struct Window
{
    QDateTime start;
    QDateTime end;
};

core::Result<data::Calendar> loadCalendar(const QString &path, bool json)
{
    if (!json) {
        return data::IcsCodec::importFromFile(path);
    }
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return core::makeError(core::ErrorCode::Io,
                               QStringLiteral("Cannot open %1: %2").arg(path, file.errorString()));
    }
    return data::JsonCodec::fromJson(file.readAll());
}

core::Result<Window> resolveWindow(const QCommandLineParser &parser, const QTimeZone &zone)
{
    if (parser.isSet(QStringLiteral("date"))) {
        const QDate date = QDate::fromString(parser.value(QStringLiteral("date")), QStringLiteral("yyyy-MM-dd"));
        if (!date.isValid()) {
            return core::makeError(core::ErrorCode::TimeParse,
                                   QStringLiteral("Invalid --date '%1'").arg(parser.value(QStringLiteral("date"))));
        }
        const auto start = core::clock::startOfDay(date, zone);
        if (!start) {
            return start.error();
        }
        const auto end = core::clock::endOfDay(date, zone);
        if (!end) {
            return end.error();
        }
        return Window{*start, *end};
    }

    if (!parser.isSet(QStringLiteral("from")) || !parser.isSet(QStringLiteral("to"))) {
        return core::makeError(core::ErrorCode::Validation,
                               QStringLiteral("Either --date or both --from and --to are required"));
    }
    const auto start = core::clock::resolve(parser.value(QStringLiteral("from")), zone);
    if (!start) {
        return start.error();
    }
    const auto end = core::clock::resolve(parser.value(QStringLiteral("to")), zone);
    if (!end) {
        return end.error();
    }
    if (*end <= *start) {
        return core::makeError(core::ErrorCode::Validation, QStringLiteral("--to must be after --from"));
    }
    return Window{*start, *end};
}

QString formatIn(const QDateTime &instant, const QTimeZone &zone)
{
    return core::clock::formatCivil(core::clock::convertTimeZone(instant, zone));
}

int report(QTextStream &out, const data::Calendar &calendar, const Window &window, const QTimeZone &zone,
           const core::Settings &settings, std::chrono::seconds minGap)
{
    QTextStream err(stderr);

    const auto occurrences = calendar.eventsBetween(window.start, window.end);
    if (!occurrences) {
        err << core::describe(occurrences.error()) << '\n';
        return 1;
    }
    out << "Calendar: " << calendar.name() << '\n';
    out << "Window:   " << formatIn(window.start, zone) << " - " << formatIn(window.end, zone) << ' '
        << QString::fromUtf8(zone.id()) << "\n\n";

    out << "Occurrences (" << occurrences->size() << ")\n";
    for (const data::Occurrence &occurrence : *occurrences) {
        const data::Event &event = calendar.eventFor(occurrence);
        out << "  " << formatIn(occurrence.start, zone) << " - " << formatIn(calendar.endOf(occurrence), zone)
            << "  " << event.title() << " [" << data::eventStatusName(event.status()) << "]\n";
    }

    analysis::ScheduleAnalyzer analyzer(calendar);
    analyzer.setSuggestionStep(std::chrono::minutes(settings.suggestionStepMinutes));
    analyzer.setSlotLookback(std::chrono::hours(settings.slotLookbackHours));

    const auto gaps = analyzer.findGaps(window.start, window.end, minGap);
    if (!gaps) {
        err << core::describe(gaps.error()) << '\n';
        return 1;
    }
    out << "\nGaps (" << gaps->size() << ")\n";
    for (const analysis::TimeGap &gap : *gaps) {
        out << "  " << formatIn(gap.start, zone) << " - " << formatIn(gap.end, zone) << "  "
            << gap.durationMinutes() << " min";
        if (!gap.precedingLabel.isEmpty()) {
            out << "  after " << gap.precedingLabel;
        }
        if (!gap.followingLabel.isEmpty()) {
            out << "  before " << gap.followingLabel;
        }
        out << '\n';
    }

    const auto overlaps = analyzer.findOverlaps(window.start, window.end);
    if (!overlaps) {
        err << core::describe(overlaps.error()) << '\n';
        return 1;
    }
    out << "\nOverlaps (" << overlaps->size() << ")\n";
    for (const analysis::Overlap &overlap : *overlaps) {
        out << "  " << formatIn(overlap.start, zone) << " - " << formatIn(overlap.end, zone) << "  "
            << overlap.durationMinutes() << " min  " << overlap.participants.join(QStringLiteral(" / ")) << '\n';
    }

    const auto density = analyzer.calculateDensity(window.start, window.end);
    if (!density) {
        err << core::describe(density.error()) << '\n';
        return 1;
    }
    out << "\nOccupancy: " << QString::number(density->occupancyPercent, 'f', 1) << "% ("
        << density->busyDuration.count() / 60 << " of " << density->windowDuration.count() / 60 << " min busy)";
    if (density->isBusy()) {
        out << " busy";
    } else if (density->isLight()) {
        out << " light";
    }
    if (density->hasConflicts()) {
        out << ", conflicts";
    }
    out << '\n';
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Agenda"));
    QCoreApplication::setApplicationName(QStringLiteral("agenda-cli"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kAgendaVersion));

    QCoreApplication app(argc, argv);

    QSettings storedSettings;
    const core::Settings settings = core::Settings::load(storedSettings);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Lists occurrences, free gaps, overlaps and occupancy"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("file"), QStringLiteral("Calendar file (.ics, or JSON with --json)"));
    parser.addOptions({
        {QStringLiteral("from"), QStringLiteral("Window start, yyyy-MM-dd hh:mm:ss"), QStringLiteral("civil")},
        {QStringLiteral("to"), QStringLiteral("Window end, yyyy-MM-dd hh:mm:ss"), QStringLiteral("civil")},
        {QStringLiteral("date"), QStringLiteral("Analyze one whole day, yyyy-MM-dd"), QStringLiteral("date")},
        {QStringLiteral("tz"), QStringLiteral("Zone of the window and the output"), QStringLiteral("zone"),
         settings.defaultTimeZone},
        {QStringLiteral("min-gap"), QStringLiteral("Smallest gap to report, in minutes"), QStringLiteral("minutes"),
         QString::number(settings.minimumGapMinutes)},
        {QStringLiteral("json"), QStringLiteral("Read the calendar as JSON instead of iCalendar")},
    });
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        err << "Expected exactly one calendar file\n";
        parser.showHelp(2);
    }

    const auto zone = core::clock::parseTimeZone(parser.value(QStringLiteral("tz")));
    if (!zone) {
        err << core::describe(zone.error()) << '\n';
        return 2;
    }

    bool minGapOk = false;
    const int minGapMinutes = parser.value(QStringLiteral("min-gap")).toInt(&minGapOk);
    if (!minGapOk || minGapMinutes < 0) {
        err << "Invalid --min-gap '" << parser.value(QStringLiteral("min-gap")) << "'\n";
        return 2;
    }

    const auto window = resolveWindow(parser, *zone);
    if (!window) {
        err << core::describe(window.error()) << '\n';
        return 2;
    }

    auto calendar = loadCalendar(positional.front(), parser.isSet(QStringLiteral("json")));
    if (!calendar) {
        err << core::describe(calendar.error()) << '\n';
        return 1;
    }
    calendar->setMaxOccurrencesPerEvent(settings.maxOccurrencesPerEvent);

    return report(out, *calendar, *window, *zone, settings, std::chrono::minutes(minGapMinutes));
}
