#pragma once

#include "tracker/RateConverter.hpp"
#include "util/RollingAverage.hpp"

#include <vector>

namespace tracker {

/**
 * When a day's trailing average counts as available, given how many valid
 * closes have been seen up to and including that day.
 *
 * MoreThanWindow: strictly more than windowSize valid closes.  The first
 *   average shows up one day later than strictly necessary; this is what the
 *   existing reports were produced with and stays the default.
 * AtLeastWindow: windowSize valid closes are enough.
 */
enum class AverageThreshold {
	MoreThanWindow,
	AtLeastWindow
};

class MovingAverageProcessor
{
public:
	MovingAverageProcessor(RateConverter & rates, size_t windowSize,
	                       AverageThreshold threshold = AverageThreshold::MoreThanWindow);

	// `series` is newest-first; the records come back oldest-first, one per day
	std::vector<DailyRecord> process(Currency const & currency, std::vector<PricePoint> const & series);

private:
	bool available(size_t validCloses) const;

	RateConverter & rates;
	size_t window;
	AverageThreshold rule;
};

}
