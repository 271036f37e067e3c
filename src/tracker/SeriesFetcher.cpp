#include "tracker/SeriesFetcher.hpp"
#include "tracker/Errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace tracker {

SeriesFetcher::SeriesFetcher(PriceSource & source, size_t windowSize)
: source(source), windowSize(windowSize)
{
	if (windowSize == 0)
		throw std::invalid_argument("SeriesFetcher: window size must be positive");
}

Window SeriesFetcher::request(Window const & window) const
{
	Window ret = window;
	ret.days = window.days + static_cast<unsigned>(windowSize) - 1;
	return ret;
}

std::vector<PricePoint> SeriesFetcher::fetch(Currency const & currency, Window const & window)
{
	auto ret = source.history(currency, request(window));

	if (ret.empty() || ret.size() < windowSize)
		throw DataError("not enough data points for " + currency.name + ": " +
			std::to_string(ret.size()) + " < " + std::to_string(windowSize));

	if (ret.front().date < ret.back().date)
		std::reverse(ret.begin(), ret.end());
	return ret;
}

}
