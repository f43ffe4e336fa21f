#pragma once

#include <QString>

class QSettings;

namespace agenda {
namespace core {

struct Settings
{
    QString calendarDirectory;
    int yearsAhead = 100;
    int maxOccurrencesPerEntry = 1000;
    int totalExpansionBudget = 100000;

    static Settings load(const QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace agenda
