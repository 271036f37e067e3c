#pragma once

#include "util/Dates.hpp"

#include <boost/multiprecision/gmp.hpp>
#include <boost/optional.hpp>
#include <ios>
#include <string>

namespace tracker {

typedef boost::multiprecision::mpf_float_50 number;
typedef boost::multiprecision::mpz_int integer;

extern char const * const Version;

// digits kept after the decimal point in report cells and payloads
static const std::streamsize Decimals = 10;

// plain notation, trailing zeros dropped
inline std::string format(number const & value)
{
	std::string ret = value.str(Decimals, std::ios_base::fixed);
	if (ret.find('.') != std::string::npos) {
		ret.erase(ret.find_last_not_of('0') + 1);
		if (ret.back() == '.')
			ret.pop_back();
	}
	return ret;
}

inline std::string format(integer const & value)
{
	return value.str();
}

struct Currency
{
	std::string name; // display name, also names the report sheet
	std::string symbol; // ticker, the accounting system's currency code
	std::string cmc; // coinmarketcap slug
	std::string cmcId; // coinmarketcap numeric id
};

struct PricePoint
{
	Day date;
	number open;
	number high;
	number low;
	number close;
	number volume;
	integer marketCap; // zero when the source omits it
};

struct DailyRecord
{
	PricePoint price;
	number average; // zero until enough history has accumulated
	bool averageAvailable;
	number rate;

	bool hasAverage() const { return averageAvailable; }
	number dailyAverage() const { return (price.open + price.close) / 2; }
	number convertedAverage() const { return dailyAverage() * rate; }
};

/**
 * The reported period: `days` days ending at `last`, or ending at the most
 * recent quote the source has when `last` is unset.
 */
struct Window
{
	unsigned days;
	boost::optional<Day> last;

	Day end(Day now) const { return last ? *last : now; }
	Day begin(Day now) const { return addDays(end(now), 1 - static_cast<int>(days)); }
};

}
