#pragma once

#include "tracker/MovingAverage.hpp"
#include "tracker/Types.hpp"

#include <istream>
#include <string>
#include <vector>

namespace tracker {

struct Settings
{
	unsigned days = 15;
	unsigned windowSize = 14;
	AverageThreshold threshold = AverageThreshold::MoreThanWindow;
	boost::optional<Day> from;
	boost::optional<Day> to;

	std::string configFile = "config.json";
	std::string reportDirectory = "Crypto-HistoricalPrice";
	bool delta = true;

	std::string priorityEndpoint;
	std::string priorityUsername;
	std::string priorityPassword;

	Window window(Day now) const;
};

// Fills `settings` from the command line.  Returns false when only help or
// the version was asked for (and has been printed).  Throws
// boost::program_options::error or std::invalid_argument on bad input.
bool parseCommandLine(int argc, char const * const * argv, Settings & settings);

std::vector<Currency> readCurrencies(std::istream & json);

// looks next to the executable first, then relative to the working directory
std::vector<Currency> loadCurrencies(std::string const & executable, std::string const & configFile);

// "2024-01-01" or "2024-01-01_2024-01-31", relative to the working directory
std::string deltaReportName(Window const & window, Day now);

}
