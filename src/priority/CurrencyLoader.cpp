#include "priority/CurrencyLoader.hpp"

#include <boost/property_tree/json_parser.hpp>

#include "Poco/Exception.h"
#include "Poco/URI.h"
#include "Poco/Net/HTTPBasicCredentials.h"
#include "Poco/Net/HTTPClientSession.h"
#include "Poco/Net/HTTPRequest.h"
#include "Poco/Net/HTTPResponse.h"
#include "Poco/Net/HTTPSClientSession.h"

#include <iostream>
#include <memory>
#include <sstream>

using namespace Poco::Net;

namespace priority {

CurrencyLoader::CurrencyLoader(std::string endpoint, std::string username, std::string password)
: endpoint(endpoint), username(username), password(password)
{ }

std::string CurrencyLoader::url(tracker::Currency const & currency) const
{
	return endpoint + "/CURRENCIES('" + currency.symbol + "')/LOADCURRENCY_SUBFORM";
}

std::string CurrencyLoader::requestBody(tracker::number const & exchangeRate, Day day)
{
	// written by hand: property_tree would quote the rate
	std::ostringstream ss;
	ss << "{\"EXCHANGE\":" << tracker::format(exchangeRate)
	   << ",\"CURDATE\":\"" << formatDay(day, "%Y-%m-%dT00:00:00Z") << "\"}";
	return ss.str();
}

std::string CurrencyLoader::errorText(std::istream & response)
{
	boost::property_tree::ptree pt;
	try {
		read_json(response, pt);
	} catch (boost::property_tree::json_parser_error const &) {
		return "";
	}
	return pt.get<std::string>("FORM.InterfaceErrors.text", "");
}

bool CurrencyLoader::forward(tracker::Currency const & currency, tracker::number const & exchangeRate, Day day)
{
	std::cout << "Inserting to Priority {" << currency.name << ", " << tracker::format(exchangeRate)
	          << ", " << formatDay(day, ISODate) << "}..." << std::endl;

	try {
		Poco::URI uri(url(currency));
		std::unique_ptr<HTTPClientSession> session;
		if (uri.getScheme() == "https")
			session.reset(new HTTPSClientSession(uri.getHost(), uri.getPort()));
		else
			session.reset(new HTTPClientSession(uri.getHost(), uri.getPort()));

		std::string body = requestBody(exchangeRate, day);
		HTTPRequest request(HTTPRequest::HTTP_POST, uri.getPathEtc(), HTTPMessage::HTTP_1_1);
		HTTPBasicCredentials(username, password).authenticate(request);
		request.setContentType("application/json");
		request.setContentLength(body.size());
		session->sendRequest(request) << body;

		HTTPResponse response;
		std::istream & rs = session->receiveResponse(response);
		if (response.getStatus() != HTTPResponse::HTTP_CREATED) {
			std::cerr << "priority: insert ERROR {" << static_cast<int>(response.getStatus()) << "}: "
			          << errorText(rs) << std::endl;
			return false;
		}
	} catch (Poco::Exception const & e) {
		std::cerr << "priority: insert of " << currency.name << " failed: " << e.displayText() << std::endl;
		return false;
	}

	std::cout << "Priority insert of Currency " << currency.name << " -> successful!" << std::endl;
	return true;
}

}
