#include "util/Config.hpp"

#include <stdexcept>

#include <boost/property_tree/json_parser.hpp>

namespace trendline {

Config::Config()
: window(0), bands("2"), xColumn(0), yColumn(1), skipRows(0), delimiter(','), arithmetic(DECIMAL)
{}

void Config::read(boost::property_tree::ptree const & pt)
{
	window = pt.get<size_t>("window", window);
	bands = pt.get<std::string>("bands", bands);
	xColumn = pt.get<size_t>("xColumn", xColumn);
	yColumn = pt.get<size_t>("yColumn", yColumn);
	skipRows = pt.get<size_t>("skipRows", skipRows);

	std::string delim = pt.get<std::string>("delimiter", std::string(1, delimiter));
	if (delim.size() != 1)
		throw std::invalid_argument("delimiter must be one character: \"" + delim + "\"");
	delimiter = delim[0];

	std::string type = pt.get<std::string>("arithmetic", arithmetic == BINARY ? "binary" : "decimal");
	if (type == "decimal")
		arithmetic = DECIMAL;
	else if (type == "binary")
		arithmetic = BINARY;
	else
		throw std::invalid_argument("unknown arithmetic: " + type);

	if (xColumn == yColumn)
		throw std::invalid_argument("xColumn and yColumn are both " + std::to_string(xColumn));
}

Config Config::load(std::istream & json)
{
	boost::property_tree::ptree pt;
	read_json(json, pt);
	Config ret;
	ret.read(pt);
	return ret;
}

}
