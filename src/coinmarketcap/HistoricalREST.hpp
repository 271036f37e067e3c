#pragma once

#include "tracker/Sources.hpp"

#include <boost/property_tree/ptree.hpp>
#include <string>
#include <vector>

namespace coinmarketcap {

/**
 * Daily OHLCV history from coinmarketcap's public web api.
 */
class HistoricalREST : public tracker::PriceSource
{
public:
	HistoricalREST(std::string base = "https://web-api.coinmarketcap.com/v1/cryptocurrency/ohlcv/historical");

	// throws tracker::TransportError or tracker::DataError
	std::vector<tracker::PricePoint> history(tracker::Currency const & currency, tracker::Window const & window) override;

	std::string url(tracker::Currency const & currency, tracker::Window const & window) const;

	// data.quotes[].quote.USD, in the order the response lists them
	static std::vector<tracker::PricePoint> parseQuotes(boost::property_tree::ptree const & pt);

private:
	std::string base;
};

}
