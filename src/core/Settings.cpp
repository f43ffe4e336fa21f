#include "agenda/core/Settings.hpp"

#include "agenda/core/RecurrenceExpander.hpp"

#include <QSettings>

namespace agenda {
namespace core {

Settings Settings::load(const QSettings &settings)
{
    Settings result;
    result.calendarDirectory = settings.value(QStringLiteral("calendar/directory")).toString();
    result.yearsAhead = qMax(0, settings.value(QStringLiteral("window/yearsAhead"), result.yearsAhead).toInt());
    // The per entry cap may be lowered but never raised.
    result.maxOccurrencesPerEntry = qBound(1,
                                           settings.value(QStringLiteral("expansion/maxOccurrencesPerEntry"),
                                                          result.maxOccurrencesPerEntry)
                                               .toInt(),
                                           RecurrenceExpander::MaxOccurrences);
    result.totalExpansionBudget = qMax(1,
                                       settings.value(QStringLiteral("expansion/totalBudget"),
                                                      result.totalExpansionBudget)
                                           .toInt());
    return result;
}

void Settings::save(QSettings &settings) const
{
    settings.setValue(QStringLiteral("calendar/directory"), calendarDirectory);
    settings.setValue(QStringLiteral("window/yearsAhead"), yearsAhead);
    settings.setValue(QStringLiteral("expansion/maxOccurrencesPerEntry"), maxOccurrencesPerEntry);
    settings.setValue(QStringLiteral("expansion/totalBudget"), totalExpansionBudget);
}

} // namespace core
} // namespace agenda
