#include "tracker/MovingAverage.hpp"

#include <iostream>

namespace tracker {

MovingAverageProcessor::MovingAverageProcessor(RateConverter & rates, size_t windowSize, AverageThreshold threshold)
: rates(rates), window(windowSize), rule(threshold)
{ }

bool MovingAverageProcessor::available(size_t validCloses) const
{
	if (rule == AverageThreshold::AtLeastWindow)
		return validCloses >= window;
	return validCloses > window;
}

std::vector<DailyRecord> MovingAverageProcessor::process(Currency const & currency, std::vector<PricePoint> const & series)
{
	RollingAverage<number> closes(window);
	std::vector<DailyRecord> ret;
	ret.reserve(series.size());

	for (auto it = series.rbegin(); it != series.rend(); ++ it) {
		PricePoint const & e = *it;

		number rate = rates.rate(e.date);

		std::cout << "Processing: " << currency.name << " " << formatDay(e.date, ISODate) << " -"
		          << " open: " << format(e.open) << " USD"
		          << " high: " << format(e.high) << " USD"
		          << " low: " << format(e.low) << " USD"
		          << " close: " << format(e.close) << " USD"
		          << " volume: " << format(e.volume)
		          << " market cap: " << format(e.marketCap)
		          << " rate: " << format(rate) << std::endl;

		// non-positive closes are gaps in the source data
		if (e.close > 0)
			closes.add(e.close);

		DailyRecord record;
		record.price = e;
		record.averageAvailable = available(closes.count());
		record.average = record.averageAvailable ? closes.avg() : number(0);
		record.rate = rate;
		ret.push_back(record);
	}

	return ret;
}

}
