#pragma once

#include "tracker/Types.hpp"

#include <vector>

namespace tracker {

class PriceSource
{
public:
	virtual ~PriceSource() {}

	// window.days daily quotes ending at window.last (or at the latest quote),
	// in whatever order the source delivers them
	virtual std::vector<PricePoint> history(Currency const & currency, Window const & window) = 0;
};

class RateSource
{
public:
	virtual ~RateSource() {}

	// rate published for exactly this day, zero when none was published
	virtual number rate(Day day) = 0;
};

/**
 * Pushes a converted daily rate to an external accounting system.
 * Returns false, after logging, when the push did not succeed.
 */
class Forwarder
{
public:
	virtual ~Forwarder() {}

	virtual bool forward(Currency const & currency, number const & exchangeRate, Day day) = 0;
};

}
