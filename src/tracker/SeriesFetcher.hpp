#pragma once

#include "tracker/Sources.hpp"

#include <vector>

namespace tracker {

class SeriesFetcher
{
public:
	SeriesFetcher(PriceSource & source, size_t windowSize);

	// Newest-first series covering `window` plus the windowSize - 1 days
	// before it that seed the moving average.
	// Throws DataError when fewer than windowSize points come back.
	std::vector<PricePoint> fetch(Currency const & currency, Window const & window);

	Window request(Window const & window) const;

private:
	PriceSource & source;
	size_t windowSize;
};

}
