#include "coinmarketcap/HistoricalREST.hpp"
#include "tracker/Errors.hpp"
#include "util/URIFile.hpp"

#include "Poco/Exception.h"
#include "Poco/Net/HTTPException.h"

#include <stdexcept>

namespace coinmarketcap {

using tracker::PricePoint;
using tracker::number;
using tracker::integer;


HistoricalREST::HistoricalREST(std::string base)
: base(base)
{ }

std::string HistoricalREST::url(tracker::Currency const & currency, tracker::Window const & window) const
{
	std::string ret = base + "?id=" + currency.cmcId +
		"&convert=USD" +
		"&count=" + std::to_string(window.days);
	// the period of a day closes at the following midnight
	if (window.last)
		ret += "&time_end=" + formatDay(addDays(*window.last, 1), ISODate);
	return ret;
}

static PricePoint parseQuote(boost::property_tree::ptree const & pt)
{
	// market_cap is missing for freshly listed coins and comes in as a float
	double marketCap = pt.get<double>("market_cap", 0);

	PricePoint ret = {
		parseDay(pt.get<std::string>("timestamp")),
		pt.get<number>("open"),
		pt.get<number>("high"),
		pt.get<number>("low"),
		pt.get<number>("close"),
		pt.get<number>("volume"),
		integer(static_cast<long long>(marketCap))
	};
	return ret;
}

std::vector<PricePoint> HistoricalREST::parseQuotes(boost::property_tree::ptree const & pt)
{
	std::vector<PricePoint> ret;
	try {
		for (auto & pts : pt.get_child("data.quotes"))
			ret.push_back(parseQuote(pts.second.get_child("quote.USD")));
	} catch (boost::property_tree::ptree_error const & e) {
		throw tracker::DataError(std::string("coinmarketcap: malformed quotes: ") + e.what());
	} catch (std::invalid_argument const & e) {
		throw tracker::DataError(std::string("coinmarketcap: ") + e.what());
	} catch (std::runtime_error const & e) {
		// gmp rejecting a partly numeric field
		throw tracker::DataError(std::string("coinmarketcap: bad number: ") + e.what());
	}
	return ret;
}

std::vector<PricePoint> HistoricalREST::history(tracker::Currency const & currency, tracker::Window const & window)
{
	std::string uri = url(currency, window);
	boost::property_tree::ptree pt;
	try {
		pt = URIFile(uri).getJSON();
	} catch (Poco::Net::HTTPException const & e) {
		throw tracker::TransportError("coinmarketcap: status code error: " + e.displayText());
	} catch (Poco::Exception const & e) {
		throw tracker::TransportError("coinmarketcap: " + e.displayText());
	} catch (boost::property_tree::ptree_error const & e) {
		throw tracker::DataError(std::string("coinmarketcap: malformed response: ") + e.what());
	}
	return parseQuotes(pt);
}

}
