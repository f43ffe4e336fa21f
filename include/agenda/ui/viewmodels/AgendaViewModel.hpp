#pragma once

#include <QObject>
#include <QtGlobal>
#include <optional>

#include "agenda/core/DayProjector.hpp"
#include "agenda/core/Settings.hpp"

namespace agenda {
namespace data {
class EntryRepository;
}

namespace ui {

class AgendaViewModel : public QObject
{
    Q_OBJECT

public:
    AgendaViewModel(data::EntryRepository &repository,
                    const core::Settings &settings = core::Settings(),
                    QObject *parent = nullptr);

    bool setRange(qint64 start, qint64 end);
    void setNow(qint64 now);
    void refresh();

    QString calendarName() const;
    const core::DayView &dayView() const;

signals:
    void dayViewChanged(const agenda::core::DayView &view);

private:
    data::EntryRepository &m_repository;
    core::DayProjector m_projector;
    qint64 m_start = 0;
    qint64 m_end = 0;
    bool m_hasRange = false;
    std::optional<qint64> m_now;
    core::DayView m_view;
};

} // namespace ui
} // namespace agenda
