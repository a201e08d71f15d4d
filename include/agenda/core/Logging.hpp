#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcAgendaClock)
Q_DECLARE_LOGGING_CATEGORY(lcAgendaRecurrence)
Q_DECLARE_LOGGING_CATEGORY(lcAgendaCalendar)
Q_DECLARE_LOGGING_CATEGORY(lcAgendaIcs)
Q_DECLARE_LOGGING_CATEGORY(lcAgendaJson)
Q_DECLARE_LOGGING_CATEGORY(lcAgendaAnalysis)
