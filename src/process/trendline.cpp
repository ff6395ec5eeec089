#include "util/CSV.hpp"
#include "util/Config.hpp"
#include "util/Trendline.hpp"
#include "util/URIFile.hpp"

#include <iostream>
#include <string>

using namespace trendline;

int main(int argc, const char ** argv)
{
	if (argc < 2 || argc > 3) {
		std::cerr << "Usage: " << argv[0] << " <data.csv[.gz]> [config.json]" << std::endl;
		return 1;
	}

	try {
		Config config;
		if (argc == 3)
			config = Config::load(*URIFile(argv[2]).stream);

		// a name ending in 'z' is read as gzip
		std::string data = argv[1];
		URIFile file(data, !data.empty() && data[data.size()-1] == 'z');
		CSV csv(*file.stream, config.delimiter);
		trend(csv, config, std::cout, std::cerr);
	} catch (std::exception const & e) {
		std::cerr << e.what() << std::endl;
		return 1;
	}

	return 0;
}
