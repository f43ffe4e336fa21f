#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <optional>

#include "version.h"

#include "agenda/core/Logging.hpp"
#include "agenda/core/Settings.hpp"
#include "agenda/data/DirectoryEntryRepository.hpp"
#include "agenda/data/TemporalValue.hpp"
#include "agenda/ui/AgendaFormatter.hpp"
#include "agenda/ui/viewmodels/AgendaViewModel.hpp"

namespace {

std::optional<qint64> parseWindowBound(const QString &value)
{
    QString error;
    const auto parsed = agenda::data::parseTemporalValue(value, &error);
    if (!parsed) {
        qCCritical(lcAgendaApp) << "Invalid window bound" << value << error;
        return std::nullopt;
    }
    return parsed->instant;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("agenda"));
    QCoreApplication::setApplicationName(QStringLiteral("agenda"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kAgendaVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Lists the events of a directory of calendar files by day."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("dir"), QObject::tr("Directory containing the calendar files."));
    parser.addPositionalArgument(QStringLiteral("start_date"), QObject::tr("Window start (YYYYMMDD[THHMMSS])."),
                                 QStringLiteral("[start_date]"));
    parser.addPositionalArgument(QStringLiteral("end_date"), QObject::tr("Window end (YYYYMMDD[THHMMSS])."),
                                 QStringLiteral("[end_date]"));
    const QCommandLineOption sourcesOption(QStringLiteral("sources"),
                                           QObject::tr("Append the originating file to every line."));
    const QCommandLineOption todayOption(QStringLiteral("today"),
                                         QObject::tr("Start the listing at today's events."));
    parser.addOption(sourcesOption);
    parser.addOption(todayOption);
    parser.process(app);

    QSettings storedSettings;
    const agenda::core::Settings settings = agenda::core::Settings::load(storedSettings);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList args = parser.positionalArguments();
    const QString directory = args.value(0, settings.calendarDirectory);
    if (directory.isEmpty()) {
        err << "Usage: agenda <dir> [<start_date>] [<end_date>]\n";
        return 1;
    }

    qint64 windowStart = agenda::data::localInstant(1, 1, 1);
    qint64 windowEnd = agenda::data::advance(QDateTime::currentSecsSinceEpoch(), settings.yearsAhead,
                                             agenda::data::Frequency::Yearly);
    if (args.size() > 1) {
        const auto start = parseWindowBound(args.at(1));
        if (!start) {
            return 1;
        }
        windowStart = *start;
    }
    if (args.size() > 2) {
        const auto end = parseWindowBound(args.at(2));
        if (!end) {
            return 1;
        }
        windowEnd = *end;
    }

    agenda::data::DirectoryEntryRepository repository(directory);
    if (!repository.isValid()) {
        return 2;
    }

    agenda::ui::AgendaViewModel model(repository, settings);
    if (!model.setRange(windowStart, windowEnd)) {
        qCCritical(lcAgendaApp) << "Window start lies after window end";
        return 1;
    }
    model.refresh();

    const agenda::ui::AgendaListing listing = agenda::ui::AgendaFormatter().format(model.dayView());

    out << model.calendarName() << " Calendar\n";
    int firstLine = 0;
    if (parser.isSet(todayOption) && listing.currentLine >= 0) {
        firstLine = listing.currentLine;
    }
    for (int i = firstLine; i < listing.lines.size(); ++i) {
        out << listing.lines.at(i);
        if (parser.isSet(sourcesOption)) {
            out << "  " << listing.lineEntries.at(static_cast<std::size_t>(i)).entry.sourcePath;
        }
        out << '\n';
    }
    out.flush();
    return 0;
}
