#include "Dates.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>

char const * const ISODate = "%Y-%m-%d";
char const * const CompactDate = "%Y%m%d";
char const * const AccountingDate = "%d/%m/%y";

using server_clock = std::chrono::system_clock;
using day_duration = std::chrono::duration<long long, std::ratio<86400>>;

Day dayOf(int year, unsigned month, unsigned day)
{
	if (month < 1 || month > 12 || day < 1 || day > 31)
		throw std::invalid_argument("dayOf: date out of range");
	std::tm tm = {};
	tm.tm_year = year - 1900;
	tm.tm_mon = month - 1;
	tm.tm_mday = day;
	std::time_t t = timegm(&tm);
	// timegm normalizes 2024-02-31 into March; reject instead
	if (tm.tm_mday != static_cast<int>(day) || tm.tm_mon != static_cast<int>(month - 1))
		throw std::invalid_argument("dayOf: no such calendar day");
	return server_clock::from_time_t(t);
}

Day dayOf(server_clock::time_point tp)
{
	auto days = std::chrono::duration_cast<day_duration>(tp.time_since_epoch());
	if (days > tp.time_since_epoch())
		days -= day_duration(1);
	return Day(std::chrono::duration_cast<server_clock::duration>(days));
}

Day today()
{
	return dayOf(server_clock::now());
}

Day parseDay(std::string const & text)
{
	int year;
	unsigned month, day;
	char trailing = 0;
	int fields = std::sscanf(text.c_str(), "%4d-%2u-%2u%c", &year, &month, &day, &trailing);
	if (fields < 3 || (fields == 4 && trailing != 'T' && trailing != ' '))
		throw std::invalid_argument("parseDay: not a date: '" + text + "'");
	return dayOf(year, month, day);
}

Day addDays(Day day, int days)
{
	return day + std::chrono::duration_cast<server_clock::duration>(day_duration(days));
}

Day previousDay(Day day)
{
	return addDays(day, -1);
}

int daysBetween(Day from, Day to)
{
	return static_cast<int>(std::chrono::duration_cast<day_duration>(to - from).count());
}

std::string formatDay(Day day, char const * format)
{
	std::time_t time = server_clock::to_time_t(day);
	std::tm tm;
	gmtime_r(&time, &tm);
	char timestr[64];
	std::size_t len = std::strftime(timestr, sizeof(timestr), format, &tm);
	return std::string(timestr, len);
}
