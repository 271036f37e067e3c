#include "URIFile.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include "Poco/Net/NetSSL.h"
#include "Poco/Net/HTTPStreamFactory.h"
#include "Poco/Net/HTTPSStreamFactory.h"
#include "Poco/Net/SSLManager.h"
#include "Poco/Net/RejectCertificateHandler.h"

using namespace Poco;
using namespace Poco::Net;

class PocoNet {
public:
	PocoNet() {
		initializeSSL();
		HTTPStreamFactory::registerFactory();
		HTTPSStreamFactory::registerFactory();

		// unattended runs: a bad certificate fails the request instead of prompting
		SharedPtr<InvalidCertificateHandler> ptrCert = new RejectCertificateHandler(false);
		Context::Ptr ptrContext = new Context(Context::CLIENT_USE, "", "", "", Context::VERIFY_RELAXED, 9, true, "ALL:!ADH:!LOW:!EXP:!MD5:@STRENGTH");
		SSLManager::instance().initializeClient(0, ptrCert, ptrContext);
	}
	~PocoNet() {
		uninitializeSSL();
	}
} pocoNet;

#include "Poco/URI.h"
#include "Poco/URIStreamOpener.h"

URIFile::URIFile(std::string uri)
{
	auto & uriOpener = Poco::URIStreamOpener::defaultOpener();
	stream = std::unique_ptr<std::istream>(uriOpener.open(uri));
}


boost::property_tree::ptree URIFile::getJSON()
{
	boost::property_tree::ptree pt;
	read_json(*stream, pt);
	return pt;
}

boost::property_tree::ptree URIFile::getXML()
{
	boost::property_tree::ptree pt;
	read_xml(*stream, pt, boost::property_tree::xml_parser::trim_whitespace | boost::property_tree::xml_parser::no_comments);
	return pt;
}
