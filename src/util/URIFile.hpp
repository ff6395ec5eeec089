#pragma once

#include <istream>
#include <memory>
#include <string>

namespace trendline {

/**
 * An input stream opened from a local path or a file, http, https or ftp
 * URI, optionally gzip compressed.
 */
class URIFile
{
public:
	URIFile(std::string uri, bool gz = false);
	bool eof();

	std::unique_ptr<std::istream> stream;

private:
	std::unique_ptr<std::istream> backstream;
};

}
