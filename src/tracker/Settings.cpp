#include "tracker/Settings.hpp"
#include "tracker/Errors.hpp"

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <fstream>
#include <iostream>

namespace po = boost::program_options;

namespace tracker {

Window Settings::window(Day now) const
{
	Window ret;
	ret.days = days;
	if (from) {
		Day end = to ? *to : now;
		if (end < *from)
			throw std::invalid_argument("--from " + formatDay(*from, ISODate) + " is after " + formatDay(end, ISODate));
		ret.days = static_cast<unsigned>(daysBetween(*from, end) + 1);
		if (to)
			ret.last = *to;
	} else if (to) {
		ret.last = *to;
	}
	return ret;
}

bool parseCommandLine(int argc, char const * const * argv, Settings & settings)
{
	std::string from, to;

	po::options_description desc("Track the trailing average price of cryptocurrencies from coinmarketcap historic data.\nOptions");
	desc.add_options()
		("help,h", "print this help")
		("version", "print the version")
		("daysBackToFetch", po::value<unsigned>(&settings.days)->default_value(settings.days),
			"number of days to add to the report")
		("from", po::value<std::string>(&from), "first day to report, YYYY-MM-DD")
		("to", po::value<std::string>(&to), "last day to report, YYYY-MM-DD")
		("window", po::value<unsigned>(&settings.windowSize)->default_value(settings.windowSize),
			"number of days averaged")
		("inclusiveThreshold", "report the average as soon as `window` valid closes exist, one day earlier than the historic reports do")
		("config", po::value<std::string>(&settings.configFile)->default_value(settings.configFile),
			"currencies configuration file")
		("report", po::value<std::string>(&settings.reportDirectory)->default_value(settings.reportDirectory),
			"report directory, one sheet per currency")
		("noDelta", "do not write the per-run delta report")
		("priorityEndpoint", po::value<std::string>(&settings.priorityEndpoint),
			"if set, new rates are also loaded into priority; the test or prod odata endpoint uri")
		("priorityUsername", po::value<std::string>(&settings.priorityUsername),
			"the username for the priority API client")
		("priorityPassword", po::value<std::string>(&settings.priorityPassword),
			"the password for the priority API client");

	po::variables_map vm;
	po::store(po::parse_command_line(argc, argv, desc), vm);
	po::notify(vm);

	if (vm.count("help")) {
		std::cout << desc << std::endl;
		return false;
	}
	if (vm.count("version")) {
		std::cout << "crypto-price-tracker " << Version << std::endl;
		return false;
	}

	if (vm.count("inclusiveThreshold"))
		settings.threshold = AverageThreshold::AtLeastWindow;
	if (vm.count("noDelta"))
		settings.delta = false;
	if (!from.empty())
		settings.from = parseDay(from);
	if (!to.empty())
		settings.to = parseDay(to);

	if (settings.days == 0)
		throw std::invalid_argument("--daysBackToFetch must be positive");
	if (settings.windowSize == 0)
		throw std::invalid_argument("--window must be positive");
	if (settings.from && settings.to && *settings.to < *settings.from)
		throw std::invalid_argument("--from is after --to");
	if (settings.from && !settings.to && today() < *settings.from)
		throw std::invalid_argument("--from is in the future");
	return true;
}

std::vector<Currency> readCurrencies(std::istream & json)
{
	std::vector<Currency> ret;
	try {
		boost::property_tree::ptree pt;
		read_json(json, pt);
		for (auto & entry : pt.get_child("currencies")) {
			Currency currency = {
				entry.second.get<std::string>("name"),
				entry.second.get<std::string>("symbol"),
				entry.second.get<std::string>("cmc", ""),
				entry.second.get<std::string>("cmc_id")
			};
			ret.push_back(currency);
		}
	} catch (boost::property_tree::ptree_error const & e) {
		throw DataError(std::string("configuration: ") + e.what());
	}
	return ret;
}

std::vector<Currency> loadCurrencies(std::string const & executable, std::string const & configFile)
{
	boost::filesystem::path config(configFile);
	if (config.is_relative()) {
		auto beside = boost::filesystem::path(executable).parent_path() / config;
		if (boost::filesystem::exists(beside))
			config = beside;
	}

	std::ifstream file(config.string());
	if (!file)
		throw std::runtime_error("cannot open configuration file " + config.string());
	return readCurrencies(file);
}

std::string deltaReportName(Window const & window, Day now)
{
	std::string ret = formatDay(window.begin(now), ISODate);
	if (window.days > 1)
		ret += "_" + formatDay(window.end(now), ISODate);
	return ret;
}

}
