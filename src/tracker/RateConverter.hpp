#pragma once

#include "tracker/Sources.hpp"

#include <map>
#include <string>

namespace tracker {

/**
 * Rates resolved during one run, keyed by the requested day.  Grows
 * monotonically; nothing is ever evicted.
 */
class ExchangeRateCache
{
public:
	bool find(Day day, number & rate) const;
	void store(Day day, number const & rate);
	size_t size() const { return rates.size(); }

private:
	static std::string key(Day day);

	std::map<std::string, number> rates;
};

/**
 * Read-through lookup of the daily exchange rate.  A day without a
 * published rate takes the rate of the closest earlier day that has one,
 * walking back at most `retries` days, and the result is memoized under the
 * day originally asked for.
 */
class RateConverter
{
public:
	static const unsigned DefaultRetries = 20;

	RateConverter(RateSource & source, ExchangeRateCache & cache, unsigned retries = DefaultRetries);

	// throws RateExhausted when the budget runs out
	number rate(Day day);

private:
	RateSource & source;
	ExchangeRateCache & cache;
	unsigned budget;
};

}
