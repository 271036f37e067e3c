#pragma once

#include <memory>
#include <string>

#include <boost/property_tree/ptree.hpp>

/**
 * Opens a uri (http, https or a local path) as an input stream.
 * Poco exceptions propagate unchanged: Poco::Net::HTTPException when the
 * server answers with a non-success status, other Poco::Exception kinds for
 * transport failures.
 */
class URIFile
{
public:
	URIFile(std::string uri);
	boost::property_tree::ptree getJSON();
	boost::property_tree::ptree getXML();

	std::unique_ptr<std::istream> stream;
};
