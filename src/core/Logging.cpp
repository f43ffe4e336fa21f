#include "agenda/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcAgendaData, "agenda.data")
Q_LOGGING_CATEGORY(lcAgendaRecurrence, "agenda.recurrence")
Q_LOGGING_CATEGORY(lcAgendaApp, "agenda.app")
