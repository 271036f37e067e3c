#pragma once

#include "tracker/Types.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace tracker {

/**
 * One currency's table: a CSV file whose header row names the columns and
 * whose first column holds the row's date.  Rows are only ever appended.
 */
class CurrencySheet
{
public:
	// opens `path`, creating it with a header row when missing
	CurrencySheet(std::string path, unsigned averageDays);

	bool contains(std::string const & date) const { return dates.count(date) != 0; }
	size_t size() const { return rows; }
	std::string const & path() const { return file; }

	// throws PersistenceError
	void append(DailyRecord const & record);

	static std::vector<std::string> header(unsigned averageDays);
	static std::vector<std::string> row(DailyRecord const & record);

private:
	void load();
	void write(std::vector<std::string> const & fields);

	std::string file;
	unsigned averageDays;
	std::set<std::string> dates;
	size_t rows;
	bool unterminated;
};

/**
 * A directory of currency sheets.  Neither the directory nor a sheet exists
 * on disk before it is first asked for.
 */
class Report
{
public:
	Report(std::string directory, unsigned averageDays);

	CurrencySheet & sheet(Currency const & currency);
	std::string sheetPath(Currency const & currency) const;
	std::string const & path() const { return directory; }

private:
	std::string directory;
	unsigned averageDays;
	std::map<std::string, std::unique_ptr<CurrencySheet>> sheets;
};

}
