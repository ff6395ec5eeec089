#include "util/CSV.hpp"

#include <sstream>

namespace trendline {

static std::string trim(std::string const & str)
{
	static char const * const space = " \t\r\n";
	auto begin = str.find_first_not_of(space);
	if (begin == std::string::npos) return std::string();
	auto end = str.find_last_not_of(space);
	return str.substr(begin, end - begin + 1);
}

CSV::CSV(std::istream & stream, char delimiter)
: stream(stream),
  delimiter(delimiter),
  lineNumber(0)
{ }

CSV::Row CSV::get()
{
	std::string str;
	while (std::getline(stream, str)) {
		++ lineNumber;
		if (trim(str).empty()) continue;

		std::stringstream ss; ss << str;
		Row ret;
		std::string item;
		while (std::getline(ss, item, delimiter))
			ret.push_back(trim(item));
		return ret;
	}
	return Row();
}

bool CSV::eof()
{
	return stream.eof();
}

}
