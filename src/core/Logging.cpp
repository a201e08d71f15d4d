#include "agenda/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcAgendaClock, "agenda.clock", QtWarningMsg)
Q_LOGGING_CATEGORY(lcAgendaRecurrence, "agenda.recurrence", QtWarningMsg)
Q_LOGGING_CATEGORY(lcAgendaCalendar, "agenda.calendar", QtWarningMsg)
Q_LOGGING_CATEGORY(lcAgendaIcs, "agenda.ics", QtWarningMsg)
Q_LOGGING_CATEGORY(lcAgendaJson, "agenda.json", QtWarningMsg)
Q_LOGGING_CATEGORY(lcAgendaAnalysis, "agenda.analysis", QtWarningMsg)
