#undef NDEBUG
#include "test/Fakes.hpp"
#include "tracker/Errors.hpp"
#include "tracker/ReportMerger.hpp"

#include <algorithm>
#include <cassert>
#include <fstream>
#include <iostream>

using namespace tracker;

static std::vector<DailyRecord> records(std::string const & first, int days)
{
	std::vector<DailyRecord> ret;
	Day day = parseDay(first);
	for (int i = 0; i < days; ++ i, day = addDays(day, 1)) {
		DailyRecord record;
		record.price = test::quote(formatDay(day, ISODate), number(100 + i));
		record.average = 0;
		record.averageAvailable = false;
		record.rate = number(3.5);
		ret.push_back(record);
	}
	return ret;
}

static std::vector<std::string> lines(std::string const & path)
{
	std::vector<std::string> ret;
	std::ifstream file(path);
	std::string line;
	while (std::getline(file, line))
		ret.push_back(line);
	return ret;
}

static std::vector<std::string> firstColumn(std::string const & path)
{
	std::vector<std::string> ret;
	for (auto & line : lines(path))
		ret.push_back(line.substr(0, line.find(',')));
	return ret;
}

static void appendsOnlyNewDatesInOrder()
{
	test::TempDir dir;
	{
		Report report(dir / "report", 14);
		ReportMerger merger(report);
		auto result = merger.merge(test::bitcoin(), records("2024-01-01", 5));
		assert(result.appended == 5);
	}

	Report report(dir / "report", 14);
	test::FakeForwarder forwarder;
	ReportMerger merger(report, nullptr, &forwarder);
	auto result = merger.merge(test::bitcoin(), records("2024-01-03", 5));
	assert(result.appended == 2);
	assert(result.skipped == 3);
	assert(result.forwardFailures == 0);

	auto dates = firstColumn(report.sheetPath(test::bitcoin()));
	assert(dates.size() == 8);
	assert(dates[0] == "Date");
	assert(dates[5] == "2024-01-05");
	assert(dates[6] == "2024-01-06");
	assert(dates[7] == "2024-01-07");

	assert(forwarder.forwarded.size() == 2);
	assert(forwarder.forwarded[0] == "2024-01-06");
	assert(forwarder.forwarded[1] == "2024-01-07");
	std::cout << "appendsOnlyNewDatesInOrder: PASSED" << std::endl;
}

static void mergingTwiceIsIdempotent()
{
	test::TempDir dir;
	auto batch = records("2024-01-01", 7);
	{
		Report report(dir / "report", 14);
		ReportMerger merger(report);
		assert(merger.merge(test::bitcoin(), batch).appended == 7);
		assert(merger.merge(test::bitcoin(), batch).appended == 0);
	}
	Report report(dir / "report", 14);
	ReportMerger merger(report);
	auto result = merger.merge(test::bitcoin(), batch);
	assert(result.appended == 0);
	assert(result.skipped == 7);
	assert(lines(report.sheetPath(test::bitcoin())).size() == 8);
	assert(report.sheet(test::bitcoin()).size() == 7);
	std::cout << "mergingTwiceIsIdempotent: PASSED" << std::endl;
}

static void newestFirstBatchIsWrittenAscending()
{
	test::TempDir dir;
	auto batch = records("2024-01-01", 4);
	std::reverse(batch.begin(), batch.end());

	Report report(dir / "report", 14);
	ReportMerger merger(report);
	merger.merge(test::bitcoin(), batch);

	auto dates = firstColumn(report.sheetPath(test::bitcoin()));
	assert(dates.size() == 5);
	assert(dates[1] == "2024-01-01");
	assert(dates[4] == "2024-01-04");
	std::cout << "newestFirstBatchIsWrittenAscending: PASSED" << std::endl;
}

static void forwardFailureDoesNotBlockTheRow()
{
	test::TempDir dir;
	Report report(dir / "report", 14);
	test::FakeForwarder forwarder;
	forwarder.succeed = false;
	ReportMerger merger(report, nullptr, &forwarder);

	auto result = merger.merge(test::bitcoin(), records("2024-01-01", 3));
	assert(result.appended == 3);
	assert(result.forwardFailures == 3);
	assert(forwarder.forwarded.size() == 3);
	assert(lines(report.sheetPath(test::bitcoin())).size() == 4);
	std::cout << "forwardFailureDoesNotBlockTheRow: PASSED" << std::endl;
}

static void deltaHoldsOnlyThisRun()
{
	test::TempDir dir;
	{
		Report report(dir / "report", 14);
		ReportMerger merger(report);
		merger.merge(test::bitcoin(), records("2024-01-01", 3));
	}

	Report report(dir / "report", 14);
	Report delta(dir / "2024-01-02_2024-01-05", 14);
	ReportMerger merger(report, &delta);
	merger.merge(test::bitcoin(), records("2024-01-02", 4));

	auto dates = firstColumn(delta.sheetPath(test::bitcoin()));
	assert(dates.size() == 3);
	assert(dates[1] == "2024-01-04");
	assert(dates[2] == "2024-01-05");

	// nothing new, no delta sheet
	Report emptyDelta(dir / "nothing", 14);
	ReportMerger again(report, &emptyDelta);
	assert(again.merge(test::bitcoin(), records("2024-01-02", 4)).appended == 0);
	assert(!boost::filesystem::exists(emptyDelta.sheetPath(test::bitcoin())));
	std::cout << "deltaHoldsOnlyThisRun: PASSED" << std::endl;
}

static void rowLayout()
{
	auto header = CurrencySheet::header(14);
	assert(header.size() == 17);
	assert(header[8] == "14 Days Average");

	DailyRecord record = records("2024-01-09", 1)[0];
	record.price.open = 90; // close is 100
	record.average = number(97.5);
	record.averageAvailable = true;
	auto row = CurrencySheet::row(record);
	assert(row.size() == header.size());
	assert(row[0] == "2024-01-09");
	assert(row[4] == "100");
	assert(row[6] == "5000");
	assert(row[7] == "95");
	assert(row[8] == "97.5");
	assert(row[9] == "2024" && row[10] == "01" && row[11] == "09");
	assert(row[13] == "3.5");
	assert(row[14] == "09/01/24");
	assert(row[15] == "332.5");
	assert(row[16] == Version);
	std::cout << "rowLayout: PASSED" << std::endl;
}

static void numbersAreWrittenInPlainNotation()
{
	assert(format(number("0.00001234")) == "0.00001234");
	assert(format(number("12345678901234567")) == "12345678901234567");
	assert(format(number("44167.33")) == "44167.33");
	assert(format(number(1) / number(3)) == "0.3333333333");
	assert(format(number(0)) == "0");
	assert(format(number(-2.5)) == "-2.5");
	std::cout << "numbersAreWrittenInPlainNotation: PASSED" << std::endl;
}

static void unwritableReportThrows()
{
	test::TempDir dir;
	{
		std::ofstream file(dir / "blocked");
		file << "not a directory" << std::endl;
	}

	Report report(dir / "blocked", 14);
	ReportMerger merger(report);
	bool threw = false;
	try {
		merger.merge(test::bitcoin(), records("2024-01-01", 1));
	} catch (PersistenceError const &) {
		threw = true;
	}
	assert(threw);
	std::cout << "unwritableReportThrows: PASSED" << std::endl;
}

static void sheetWithoutFinalNewlineKeepsRowsApart()
{
	test::TempDir dir;
	boost::filesystem::create_directories(dir.path / "report");
	{
		std::ofstream file(dir / "report/Bitcoin.csv");
		file << "Date,Open\n2024-01-01,1";
	}

	{
		Report report(dir / "report", 14);
		ReportMerger merger(report);
		assert(merger.merge(test::bitcoin(), records("2024-01-01", 2)).appended == 1);
	}

	Report report(dir / "report", 14);
	CurrencySheet & sheet = report.sheet(test::bitcoin());
	assert(sheet.size() == 2);
	assert(sheet.contains("2024-01-01"));
	assert(sheet.contains("2024-01-02"));
	auto dates = firstColumn(sheet.path());
	assert(dates.size() == 3);
	assert(dates[2] == "2024-01-02");

	ReportMerger merger(report);
	assert(merger.merge(test::bitcoin(), records("2024-01-01", 2)).appended == 0);
	std::cout << "sheetWithoutFinalNewlineKeepsRowsApart: PASSED" << std::endl;
}

int main()
{
	appendsOnlyNewDatesInOrder();
	mergingTwiceIsIdempotent();
	newestFirstBatchIsWrittenAscending();
	forwardFailureDoesNotBlockTheRow();
	deltaHoldsOnlyThisRun();
	rowLayout();
	numbersAreWrittenInPlainNotation();
	unwritableReportThrows();
	sheetWithoutFinalNewlineKeepsRowsApart();
	return 0;
}
