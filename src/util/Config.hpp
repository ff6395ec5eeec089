#pragma once

#include <cstddef>
#include <istream>
#include <string>

#include <boost/property_tree/ptree.hpp>

namespace trendline {

/**
 * Settings of the trendline program.  Every key is optional in the JSON
 * document; missing keys keep their defaults.
 */
struct Config
{
	enum Arithmetic {
		DECIMAL,
		BINARY
	};

	size_t window; // points kept, 0 keeps all of them
	std::string bands; // standard deviations to the band edges
	size_t xColumn;
	size_t yColumn;
	size_t skipRows; // header rows
	char delimiter;
	Arithmetic arithmetic;

	Config();
	void read(boost::property_tree::ptree const & pt);

	static Config load(std::istream & json);
};

}
