#include "boi/ExchangeRates.hpp"
#include "coinmarketcap/HistoricalREST.hpp"
#include "priority/CurrencyLoader.hpp"
#include "tracker/Errors.hpp"
#include "tracker/Pipeline.hpp"
#include "tracker/Settings.hpp"

#include <iostream>
#include <memory>

using namespace tracker;

int main(int argc, char const ** argv)
{
	try {
		Settings settings;
		if (!parseCommandLine(argc, argv, settings))
			return 0;

		auto currencies = loadCurrencies(argv[0], settings.configFile);
		Day now = today();
		Window window = settings.window(now);

		Report report(settings.reportDirectory, settings.windowSize);
		std::unique_ptr<Report> delta;
		if (settings.delta)
			delta.reset(new Report(deltaReportName(window, now), settings.windowSize));

		std::unique_ptr<priority::CurrencyLoader> loader;
		if (!settings.priorityEndpoint.empty())
			loader.reset(new priority::CurrencyLoader(settings.priorityEndpoint,
				settings.priorityUsername, settings.priorityPassword));

		coinmarketcap::HistoricalREST prices;
		boi::ExchangeRates rates;
		ReportMerger merger(report, delta.get(), loader.get());
		Pipeline pipeline(prices, rates, merger, settings.windowSize, settings.threshold);

		pipeline.run(currencies, window);
	} catch (RateExhausted const & e) {
		std::cerr << "Cannot fetch Shekel USD values from BankOfIsrael: " << e.what() << std::endl;
		return 2;
	} catch (std::exception const & e) {
		std::cerr << e.what() << std::endl;
		return 1;
	}
	return 0;
}
