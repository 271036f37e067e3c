#include "tracker/ReportMerger.hpp"

#include <algorithm>
#include <iostream>

namespace tracker {

ReportMerger::ReportMerger(Report & report, Report * delta, Forwarder * forwarder)
: report(report), delta(delta), forwarder(forwarder)
{ }

MergeResult ReportMerger::merge(Currency const & currency, std::vector<DailyRecord> const & records)
{
	MergeResult ret = {0, 0, 0};
	CurrencySheet & sheet = report.sheet(currency);
	CurrencySheet * deltaSheet = nullptr;

	std::vector<DailyRecord const *> ordered;
	ordered.reserve(records.size());
	for (auto & record : records)
		ordered.push_back(&record);
	std::stable_sort(ordered.begin(), ordered.end(), [](DailyRecord const * a, DailyRecord const * b) {
		return a->price.date < b->price.date;
	});

	for (auto record : ordered) {
		std::string date = formatDay(record->price.date, ISODate);

		// also catches a date repeated inside the batch, since append() indexes it
		if (sheet.contains(date)) {
			// TODO: compare the stored row against the new one and report drift
			std::cout << "skipping existing row for date: " << date << std::endl;
			++ ret.skipped;
			continue;
		}

		if (forwarder && !forwarder->forward(currency, record->convertedAverage(), record->price.date))
			++ ret.forwardFailures;

		sheet.append(*record);

		if (delta) {
			if (!deltaSheet)
				deltaSheet = &delta->sheet(currency);
			deltaSheet->append(*record);
		}

		++ ret.appended;
	}

	std::cout << std::endl;
	return ret;
}

}
