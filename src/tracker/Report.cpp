#include "tracker/Report.hpp"
#include "tracker/Errors.hpp"
#include "util/CSV.hpp"

#include <boost/filesystem.hpp>
#include <fstream>

#ifndef CPT_VERSION
#define CPT_VERSION "1.0.0"
#endif

namespace tracker {

char const * const Version = CPT_VERSION;

CurrencySheet::CurrencySheet(std::string path, unsigned averageDays)
: file(path), averageDays(averageDays), rows(0), unterminated(false)
{
	if (boost::filesystem::exists(file))
		load();
	else
		write(header(averageDays));
}

std::vector<std::string> CurrencySheet::header(unsigned averageDays)
{
	return {
		"Date",
		"Open",
		"High",
		"Low",
		"Close",
		"Volume",
		"Market Cap",
		"Daily Average",
		std::to_string(averageDays) + " Days Average",
		"Year",
		"Month",
		"Day",
		"Average USD",
		"Dollar rate",
		"Date",
		"Average ILS",
		"Importer version"
	};
}

std::vector<std::string> CurrencySheet::row(DailyRecord const & record)
{
	PricePoint const & p = record.price;
	number dailyAverage = record.dailyAverage();
	std::string date = formatDay(p.date, ISODate);
	return {
		date,
		format(p.open),
		format(p.high),
		format(p.low),
		format(p.close),
		format(p.volume),
		format(p.marketCap),
		format(dailyAverage),
		format(record.average),
		date.substr(0, 4),
		date.substr(5, 2),
		date.substr(8, 2),
		format(dailyAverage),
		format(record.rate),
		formatDay(p.date, AccountingDate),
		format(record.convertedAverage()),
		Version
	};
}

void CurrencySheet::load()
{
	CSV csv(file);
	if (!csv.good())
		throw PersistenceError("cannot read report sheet " + file);

	std::vector<std::string> line;
	bool first = true;
	while (csv.get(line)) {
		if (first) {
			first = false;
			continue;
		}
		if (line.empty() || line[0].empty())
			continue;
		dates.insert(line[0]);
		++ rows;
	}
	if (!csv.eof())
		throw PersistenceError("error reading report sheet " + file);

	// a last line without its newline would swallow the next row
	std::ifstream tail(file, std::ios::in | std::ios::binary | std::ios::ate);
	if (tail.tellg() > 0) {
		char last = '\n';
		tail.seekg(-1, std::ios::end);
		tail.get(last);
		unterminated = last != '\n';
	}
}

void CurrencySheet::write(std::vector<std::string> const & fields)
{
	std::ofstream out(file, std::ios::out | std::ios::app);
	if (unterminated)
		out << '\n';
	out << CSV::join(fields) << '\n';
	out.flush();
	if (!out)
		throw PersistenceError("cannot write to report sheet " + file);
	unterminated = false;
}

void CurrencySheet::append(DailyRecord const & record)
{
	auto fields = row(record);
	write(fields);
	dates.insert(fields[0]);
	++ rows;
}

Report::Report(std::string directory, unsigned averageDays)
: directory(directory), averageDays(averageDays)
{ }

std::string Report::sheetPath(Currency const & currency) const
{
	return (boost::filesystem::path(directory) / (currency.name + ".csv")).string();
}

CurrencySheet & Report::sheet(Currency const & currency)
{
	auto it = sheets.find(currency.name);
	if (it != sheets.end())
		return *it->second;

	boost::system::error_code ec;
	boost::filesystem::create_directories(directory, ec);
	if (ec)
		throw PersistenceError("cannot create report directory " + directory + ": " + ec.message());

	std::unique_ptr<CurrencySheet> sheet(new CurrencySheet(sheetPath(currency), averageDays));
	CurrencySheet & ret = *sheet;
	sheets.emplace(currency.name, std::move(sheet));
	return ret;
}

}
