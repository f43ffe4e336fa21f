#include "agenda/core/RecurrenceRule.hpp"

#include "agenda/core/Logging.hpp"

#include <QStringList>

namespace agenda {
namespace core {

RecurrenceRule RecurrenceRule::parse(const QString &text)
{
    RecurrenceRule rule;

    const QStringList parts = text.split(';', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const int equalsIndex = part.indexOf('=');
        if (equalsIndex <= 0) {
            continue;
        }
        const QString key = part.left(equalsIndex).trimmed();
        const QString value = part.mid(equalsIndex + 1).trimmed();

        if (key == QLatin1String("FREQ")) {
            rule.frequency = data::frequencyFromString(value);
        } else if (key == QLatin1String("INTERVAL")) {
            bool ok = false;
            const int interval = value.toInt(&ok);
            if (ok && interval > 0) {
                rule.interval = interval;
            } else {
                qCWarning(lcAgendaRecurrence) << "Ignoring invalid INTERVAL" << value << "in" << text;
            }
        } else if (key == QLatin1String("UNTIL")) {
            if (const auto until = data::parseTemporalValue(value)) {
                rule.until = until->instant;
            } else {
                qCWarning(lcAgendaRecurrence) << "Ignoring invalid UNTIL" << value << "in" << text;
            }
        } else if (key == QLatin1String("COUNT")) {
            bool ok = false;
            const int count = value.toInt(&ok);
            if (ok && count >= 0) {
                rule.count = count;
            } else {
                qCWarning(lcAgendaRecurrence) << "Ignoring invalid COUNT" << value << "in" << text;
            }
        }
    }
    return rule;
}

} // namespace core
} // namespace agenda
