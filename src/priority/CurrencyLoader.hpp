#pragma once

#include "tracker/Sources.hpp"

#include <istream>
#include <string>

namespace priority {

/**
 * Loads daily rates into the priority ERP through its odata
 * LOADCURRENCY_SUBFORM, authenticating with Basic credentials.
 */
class CurrencyLoader : public tracker::Forwarder
{
public:
	CurrencyLoader(std::string endpoint, std::string username, std::string password);

	bool forward(tracker::Currency const & currency, tracker::number const & exchangeRate, Day day) override;

	std::string url(tracker::Currency const & currency) const;

	static std::string requestBody(tracker::number const & exchangeRate, Day day);

	// FORM.InterfaceErrors.text of an error response, empty when absent
	static std::string errorText(std::istream & response);

private:
	std::string endpoint;
	std::string username;
	std::string password;
};

}
