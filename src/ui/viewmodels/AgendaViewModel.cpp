#include "agenda/ui/viewmodels/AgendaViewModel.hpp"

#include "agenda/data/EntryRepository.hpp"

#include <QDateTime>

namespace agenda {
namespace ui {

AgendaViewModel::AgendaViewModel(data::EntryRepository &repository, const core::Settings &settings, QObject *parent)
    : QObject(parent)
    , m_repository(repository)
    , m_projector(settings)
{
}

bool AgendaViewModel::setRange(qint64 start, qint64 end)
{
    if (start > end) {
        return false;
    }
    m_start = start;
    m_end = end;
    m_hasRange = true;
    return true;
}

void AgendaViewModel::setNow(qint64 now)
{
    m_now = now;
}

void AgendaViewModel::refresh()
{
    if (!m_hasRange) {
        return;
    }
    const qint64 now = m_now ? *m_now : QDateTime::currentSecsSinceEpoch();
    m_view = m_projector.project(m_repository.fetchEntries(), m_start, m_end, now);
    emit dayViewChanged(m_view);
}

QString AgendaViewModel::calendarName() const
{
    return m_repository.name();
}

const core::DayView &AgendaViewModel::dayView() const
{
    return m_view;
}

} // namespace ui
} // namespace agenda
