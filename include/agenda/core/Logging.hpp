#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcAgendaData)
Q_DECLARE_LOGGING_CATEGORY(lcAgendaRecurrence)
Q_DECLARE_LOGGING_CATEGORY(lcAgendaApp)
