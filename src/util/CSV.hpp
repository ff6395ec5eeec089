#pragma once

#include <istream>
#include <string>
#include <vector>

namespace trendline {

class CSV
{
public:
	typedef std::vector<std::string> Row;

	CSV(std::istream & stream, char delimiter = ',');

	// The next non-blank row, or an empty row at the end of input.
	Row get();
	bool eof();
	size_t line() const { return lineNumber; }

private:
	std::istream & stream;
	char delimiter;
	size_t lineNumber;
};

}
