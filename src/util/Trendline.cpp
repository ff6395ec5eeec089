#include "util/Trendline.hpp"
#include "util/LinearRegression.hpp"

#include <algorithm>
#include <stdexcept>

namespace trendline {

template <typename Regression>
static void run(CSV & csv, Config const & config, std::ostream & out, std::ostream & err)
{
	typedef typename Regression::number number;
	typedef typename Regression::Point Point;

	Regression lr;
	number bands(config.bands.c_str());
	size_t needed = std::max(config.xColumn, config.yColumn) + 1;

	out.precision(16);

	for (size_t i = 0; i < config.skipRows; ++ i)
		csv.get();

	for (auto line = csv.get(); line.size(); line = csv.get()) {
		if (line.size() < needed) {
			err << "line " << csv.line() << ": expected " << needed << " columns, got " << line.size() << std::endl;
			continue;
		}

		number x, y;
		try {
			x = number(line[config.xColumn].c_str());
			y = number(line[config.yColumn].c_str());
		} catch (std::runtime_error const & e) {
			err << "line " << csv.line() << ": " << e.what() << std::endl;
			continue;
		}

		lr.push(Point(x, y));
		if (config.window && lr.count() > config.window)
			lr.shift();

		// two points fit exactly and leave no residual
		if (lr.count() < 3) continue;

		try {
			auto band = lr.values(x, bands);
			out << x << "," << y << "," << band[0] << "," << band[1] << "," << band[2]
				<< "," << lr.residual() << "," << lr.pearsonsR() << std::endl;
		} catch (DivisionByZeroError const & e) {
			err << "line " << csv.line() << ": degenerate points in window: " << e.what() << std::endl;
		}
	}
}

void trend(CSV & csv, Config const & config, std::ostream & out, std::ostream & err)
{
	if (config.arithmetic == Config::BINARY) {
		err << "binary arithmetic: results are rounded in base 2 and are not exact decimals" << std::endl;
		run<BinaryLinearRegression>(csv, config, out, err);
	} else {
		run<LinearRegression>(csv, config, out, err);
	}
}

}
