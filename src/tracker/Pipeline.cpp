#include "tracker/Pipeline.hpp"

#include <iostream>

namespace tracker {

Pipeline::Pipeline(PriceSource & prices, RateSource & rateSource, ReportMerger & merger,
                   size_t windowSize, AverageThreshold threshold, unsigned rateRetries)
: rates(rateSource, cache, rateRetries),
  fetcher(prices, windowSize),
  processor(rates, windowSize, threshold),
  merger(merger)
{ }

MergeResult Pipeline::process(Currency const & currency, Window const & window)
{
	std::cout << "Processing: " << currency.name << std::endl;
	std::cout << "days count: " << window.days << std::endl;
	std::cout << std::endl;

	auto series = fetcher.fetch(currency, window);
	auto records = processor.process(currency, series);
	auto ret = merger.merge(currency, records);

	std::cout << currency.name << ": " << ret.appended << " rows added, "
	          << ret.skipped << " already present";
	if (ret.forwardFailures)
		std::cout << ", " << ret.forwardFailures << " not forwarded";
	std::cout << std::endl << std::endl;
	return ret;
}

size_t Pipeline::run(std::vector<Currency> const & currencies, Window const & window)
{
	size_t ret = 0;
	for (auto & currency : currencies)
		ret += process(currency, window).appended;

	std::cout << "Finished..." << std::endl;
	return ret;
}

}
