#pragma once

#include "tracker/Sources.hpp"

#include <boost/property_tree/ptree.hpp>
#include <string>

namespace boi {

/**
 * Bank of Israel representative rates, shekels per unit of `currency`.
 */
class ExchangeRates : public tracker::RateSource
{
public:
	ExchangeRates(std::string currency = "01", std::string base = "https://www.boi.org.il/currency.xml");

	// zero when nothing was published for that day or the bank refused the
	// request; throws tracker::TransportError when the bank is unreachable
	tracker::number rate(Day day) override;

	std::string url(Day day) const;

	// CURRENCIES/CURRENCY/RATE, zero when missing; throws tracker::DataError
	// when the rate is quoted for more than one unit
	static tracker::number parseRate(boost::property_tree::ptree const & pt);

private:
	std::string currency;
	std::string base;
};

}
