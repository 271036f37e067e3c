#include "tracker/RateConverter.hpp"
#include "tracker/Errors.hpp"

#include <stdexcept>

namespace tracker {

const unsigned RateConverter::DefaultRetries;

std::string ExchangeRateCache::key(Day day)
{
	return formatDay(day, CompactDate);
}

bool ExchangeRateCache::find(Day day, number & rate) const
{
	auto it = rates.find(key(day));
	if (it == rates.end())
		return false;
	rate = it->second;
	return true;
}

void ExchangeRateCache::store(Day day, number const & rate)
{
	rates[key(day)] = rate;
}

RateConverter::RateConverter(RateSource & source, ExchangeRateCache & cache, unsigned retries)
: source(source), cache(cache), budget(retries)
{
	if (budget == 0)
		throw std::invalid_argument("RateConverter: retry budget must be positive");
}

number RateConverter::rate(Day day)
{
	number ret;
	if (cache.find(day, ret))
		return ret;

	Day query = day;
	for (unsigned attempt = 0; attempt < budget; ++ attempt) {
		ret = source.rate(query);
		if (ret != 0) {
			cache.store(day, ret);
			return ret;
		}
		query = previousDay(query);
	}

	throw RateExhausted("no exchange rate published for " + formatDay(day, ISODate) +
		" nor for the " + std::to_string(budget - 1) + " days before it");
}

}
