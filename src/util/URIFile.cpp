#include "util/URIFile.hpp"

#include "Poco/InflatingStream.h"
#include "Poco/URIStreamOpener.h"
#include "Poco/Net/Context.h"
#include "Poco/Net/FTPStreamFactory.h"
#include "Poco/Net/HTTPStreamFactory.h"
#include "Poco/Net/HTTPSStreamFactory.h"
#include "Poco/Net/RejectCertificateHandler.h"
#include "Poco/Net/SSLManager.h"

using namespace Poco;
using namespace Poco::Net;

namespace trendline {

// Local paths and file:// are handled by the opener itself.
static void registerFactories()
{
	static bool registered = [] {
		HTTPStreamFactory::registerFactory();
		HTTPSStreamFactory::registerFactory();
		FTPStreamFactory::registerFactory();

		// certificates that fail verification are refused, never prompted for
		SharedPtr<InvalidCertificateHandler> ptrCert = new RejectCertificateHandler(false);
		Context::Ptr ptrContext = new Context(Context::CLIENT_USE, "", "", "", Context::VERIFY_RELAXED, 9, true, "ALL:!ADH:!LOW:!EXP:!MD5:@STRENGTH");
		SSLManager::instance().initializeClient(0, ptrCert, ptrContext);
		return true;
	}();
	(void)registered;
}

URIFile::URIFile(std::string uri, bool gz)
{
	registerFactories();
	auto & uriOpener = URIStreamOpener::defaultOpener();
	stream = std::unique_ptr<std::istream>(uriOpener.open(uri));
	if (gz) {
		backstream = std::move(stream);
		stream = std::unique_ptr<std::istream>(new InflatingInputStream(*backstream, InflatingStreamBuf::STREAM_GZIP));
	}
}

bool URIFile::eof()
{
	return stream->eof();
}

}
