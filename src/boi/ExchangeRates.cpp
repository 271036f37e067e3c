#include "boi/ExchangeRates.hpp"
#include "tracker/Errors.hpp"
#include "util/URIFile.hpp"

#include "Poco/Exception.h"
#include "Poco/Net/HTTPException.h"

#include <iostream>

namespace boi {

using tracker::number;

ExchangeRates::ExchangeRates(std::string currency, std::string base)
: currency(currency), base(base)
{ }

std::string ExchangeRates::url(Day day) const
{
	return base + "?curr=" + currency + "&rdate=" + formatDay(day, CompactDate);
}

number ExchangeRates::parseRate(boost::property_tree::ptree const & pt)
{
	// the root element is CURRENCIES when a rate exists and an error document otherwise
	if (pt.empty())
		return 0;
	auto & root = pt.front().second;

	try {
		unsigned unit = root.get<unsigned>("CURRENCY.UNIT", 0);
		if (unit > 1)
			throw tracker::DataError("boi: wrong returned unit number " + std::to_string(unit));
		return root.get<number>("CURRENCY.RATE", number(0));
	} catch (boost::property_tree::ptree_bad_data const & e) {
		throw tracker::DataError(std::string("boi: malformed rate: ") + e.what());
	}
}

number ExchangeRates::rate(Day day)
{
	std::string uri = url(day);
	boost::property_tree::ptree pt;
	try {
		pt = URIFile(uri).getXML();
	} catch (Poco::Net::HTTPException const & e) {
		std::cerr << "boi: " << formatDay(day, ISODate) << ": " << e.displayText() << std::endl;
		return 0;
	} catch (Poco::Exception const & e) {
		throw tracker::TransportError("boi: " + e.displayText());
	} catch (boost::property_tree::ptree_error const & e) {
		throw tracker::DataError(std::string("boi: malformed response: ") + e.what());
	}
	return parseRate(pt);
}

}
