#pragma once

#include "tracker/MovingAverage.hpp"
#include "tracker/RateConverter.hpp"
#include "tracker/ReportMerger.hpp"
#include "tracker/SeriesFetcher.hpp"

#include <vector>

namespace tracker {

/**
 * Fetches, averages, converts and merges one currency after the other.  The
 * first failure aborts the run; currencies already merged keep their rows.
 */
class Pipeline
{
public:
	Pipeline(PriceSource & prices, RateSource & rateSource, ReportMerger & merger,
	         size_t windowSize, AverageThreshold threshold = AverageThreshold::MoreThanWindow,
	         unsigned rateRetries = RateConverter::DefaultRetries);

	MergeResult process(Currency const & currency, Window const & window);

	// rows appended over all currencies
	size_t run(std::vector<Currency> const & currencies, Window const & window);

	ExchangeRateCache const & rateCache() const { return cache; }

private:
	ExchangeRateCache cache;
	RateConverter rates;
	SeriesFetcher fetcher;
	MovingAverageProcessor processor;
	ReportMerger & merger;
};

}
