#undef NDEBUG
#include "test/Fakes.hpp"
#include "tracker/Errors.hpp"
#include "tracker/RateConverter.hpp"

#include <cassert>
#include <iostream>

using namespace tracker;
using test::FakeRateSource;

static void cacheHitDoesNoIO()
{
	FakeRateSource source;
	source.published["2024-01-03"] = number(3.75);
	ExchangeRateCache cache;
	RateConverter rates(source, cache);

	assert(rates.rate(parseDay("2024-01-03")) == number(3.75));
	assert(source.queried.size() == 1);
	assert(rates.rate(parseDay("2024-01-03")) == number(3.75));
	assert(source.queried.size() == 1);
	assert(cache.size() == 1);
	std::cout << "cacheHitDoesNoIO: PASSED" << std::endl;
}

static void weekendTakesFridaysRateUnderTheRequestedDay()
{
	FakeRateSource source;
	source.published["2024-01-05"] = number(3.5); // friday
	ExchangeRateCache cache;
	RateConverter rates(source, cache);

	Day sunday = parseDay("2024-01-07");
	assert(rates.rate(sunday) == number(3.5));
	assert(source.queried.size() == 3);
	assert(source.queried[0] == "2024-01-07");
	assert(source.queried[1] == "2024-01-06");
	assert(source.queried[2] == "2024-01-05");

	number cached;
	assert(cache.find(sunday, cached) && cached == number(3.5));
	// only the requested day is memoized
	assert(!cache.find(parseDay("2024-01-05"), cached));
	assert(!cache.find(parseDay("2024-01-06"), cached));

	assert(rates.rate(sunday) == number(3.5));
	assert(source.queried.size() == 3);
	std::cout << "weekendTakesFridaysRateUnderTheRequestedDay: PASSED" << std::endl;
}

static void lastDayOfTheBudgetStillResolves()
{
	FakeRateSource source;
	Day requested = parseDay("2024-02-20");
	source.published[formatDay(addDays(requested, -19), ISODate)] = number(3.6);
	ExchangeRateCache cache;
	RateConverter rates(source, cache);

	assert(rates.rate(requested) == number(3.6));
	assert(source.queried.size() == 20);
	std::cout << "lastDayOfTheBudgetStillResolves: PASSED" << std::endl;
}

static void exhaustedBudgetThrows()
{
	FakeRateSource source;
	Day requested = parseDay("2024-02-20");
	// one day too far back
	source.published[formatDay(addDays(requested, -20), ISODate)] = number(3.6);
	ExchangeRateCache cache;
	RateConverter rates(source, cache);

	bool threw = false;
	try {
		rates.rate(requested);
	} catch (RateExhausted const &) {
		threw = true;
	}
	assert(threw);
	assert(source.queried.size() == RateConverter::DefaultRetries);
	assert(cache.size() == 0);
	std::cout << "exhaustedBudgetThrows: PASSED" << std::endl;
}

static void budgetIsConfigurable()
{
	FakeRateSource source;
	ExchangeRateCache cache;
	RateConverter rates(source, cache, 3);

	bool threw = false;
	try {
		rates.rate(parseDay("2024-01-01"));
	} catch (RateExhausted const &) {
		threw = true;
	}
	assert(threw);
	assert(source.queried.size() == 3);
	assert(source.queried[2] == "2023-12-30");
	std::cout << "budgetIsConfigurable: PASSED" << std::endl;
}

static void cacheIsSharedBetweenConverters()
{
	FakeRateSource source;
	source.published["2024-01-02"] = number(3.7);
	ExchangeRateCache cache;
	{
		RateConverter rates(source, cache);
		rates.rate(parseDay("2024-01-02"));
	}
	RateConverter rates(source, cache);
	assert(rates.rate(parseDay("2024-01-02")) == number(3.7));
	assert(source.queried.size() == 1);
	std::cout << "cacheIsSharedBetweenConverters: PASSED" << std::endl;
}

int main()
{
	cacheHitDoesNoIO();
	weekendTakesFridaysRateUnderTheRequestedDay();
	lastDayOfTheBudgetStillResolves();
	exhaustedBudgetThrows();
	budgetIsConfigurable();
	cacheIsSharedBetweenConverters();
	return 0;
}
