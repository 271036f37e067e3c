#pragma once

#include <chrono>
#include <string>

/**
 * Calendar days, represented as the system_clock instant of midnight UTC.
 */
typedef std::chrono::system_clock::time_point Day;

Day dayOf(int year, unsigned month, unsigned day);
Day dayOf(std::chrono::system_clock::time_point tp);
Day today();

// Accepts "YYYY-MM-DD" and ISO-8601 timestamps such as
// "2024-01-01T23:59:59.999Z"; the time of day is dropped.
// Throws std::invalid_argument for anything else.
Day parseDay(std::string const & text);

Day addDays(Day day, int days);
Day previousDay(Day day);
int daysBetween(Day from, Day to);

// strftime format, evaluated in UTC
std::string formatDay(Day day, char const * format);

extern char const * const ISODate;       // 2024-01-31
extern char const * const CompactDate;   // 20240131
extern char const * const AccountingDate; // 31/01/24
