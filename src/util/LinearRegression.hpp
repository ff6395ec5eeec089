#pragma once

#include "util/Error.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <deque>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/multiprecision/cpp_dec_float.hpp>
#include <boost/multiprecision/gmp.hpp>
#include <boost/optional.hpp>

namespace trendline {

typedef boost::multiprecision::cpp_dec_float_50 decimal;
typedef boost::multiprecision::mpf_float_50 binary;

// The shortest decimal text that reads back as the same double.
inline std::string shortestDecimal(double value)
{
	if (!std::isfinite(value))
		throw std::invalid_argument("not a finite number");
	for (int digits = 1; ; ++ digits) {
		std::ostringstream out;
		out.imbue(std::locale::classic());
		out << std::setprecision(digits) << value;
		if (digits >= std::numeric_limits<double>::max_digits10)
			return out.str();

		std::istringstream in(out.str());
		in.imbue(std::locale::classic());
		double back = 0;
		in >> back;
		if (back == value)
			return out.str();
	}
}

template <typename Number, typename Value>
Number toNumber(Value const & value)
{
	return Number(value);
}

// 0.3 becomes 0.3, not the binary expansion of the double nearest to it.
template <typename Number>
Number toNumber(double value)
{
	return Number(shortestDecimal(value).c_str());
}

template <typename Number>
struct BasicPoint
{
	Number x;
	Number y;

	BasicPoint(Number x, Number y)
	: x(x), y(y)
	{}

	template <typename X, typename Y, typename = typename std::enable_if<
		std::is_convertible<X, Number>::value && std::is_convertible<Y, Number>::value>::type>
	BasicPoint(X const & x, Y const & y)
	: x(toNumber<Number>(x)), y(toNumber<Number>(y))
	{}
};

// Least squares fit of Y = bX + a over a window of points.  Not thread safe.
template <typename Number>
class BasicLinearRegression
{
public:
	typedef Number number;
	typedef BasicPoint<Number> Point;

	// A point with its products, computed once on push.
	struct StoredPoint
	{
		number x;
		number y;
		number xy;
		number xSquared;
		number ySquared;

		StoredPoint(Point const & point);
	};

	struct Sums
	{
		number x;
		number y;
		number xy;
		number xSquared;
		number ySquared;

		Sums();
		void add(StoredPoint const & point);
		void subtract(StoredPoint const & point);
	};

	struct Coefficients
	{
		number a; // intercept
		number b; // slope
	};

	struct DerivedStats
	{
		number residual; // standard deviation of the residuals
		number pearsonsR;
	};

	BasicLinearRegression();
	BasicLinearRegression(Point const & point);
	BasicLinearRegression(std::vector<Point> const & points);

	void push(Point const & point);
	void push(std::vector<Point> const & points);
	template <typename Iterator>
	void push(Iterator first, Iterator last);

	// Removes the oldest point.  Does nothing when empty.
	void shift();

	size_t count() const { return data.size(); }

	// Nothing is cached when this throws.
	BasicLinearRegression & calculate();
	bool calculated() const { return static_cast<bool>(fit); }

	number a();
	number b();

	number value(number const & x);
	number value(double x);

	// root mean square deviation of the points from the line
	number residual(number const & multiplier = 1);
	number residual(double multiplier);
	number standardDeviation(number const & multiplier = 1);
	number standardDeviation(double multiplier);

	number pearsonsR();

	// negative deviations give the lower band
	number standardDeviationValue(number const & x, number const & deviations);
	number standardDeviationValue(double x, double deviations);

	// {lower band, line, upper band}
	std::array<number, 3> values(number const & x, number const & deviations = 2);
	std::array<number, 3> values(double x, double deviations = 2);

	Sums const & sums() const { return sum; }

	StoredPoint const & front() const { return data.front(); }
	StoredPoint const & back() const { return data.back(); }
	typename std::deque<StoredPoint>::const_iterator begin() const { return data.begin(); }
	typename std::deque<StoredPoint>::const_iterator end() const { return data.end(); }

private:
	struct Fit
	{
		Coefficients coefficients;
		DerivedStats stats;
	};

	Fit const & current();
	static number divide(number const & dividend, number const & divisor);

	std::deque<StoredPoint> data;
	Sums sum;
	boost::optional<Fit> fit;
};

typedef BasicLinearRegression<decimal> LinearRegression;
typedef BasicLinearRegression<binary> BinaryLinearRegression;
typedef BasicPoint<decimal> Point;

template <typename Number>
BasicLinearRegression<Number>::StoredPoint::StoredPoint(Point const & point)
: x(point.x), y(point.y), xy(point.x * point.y), xSquared(point.x * point.x), ySquared(point.y * point.y)
{}

template <typename Number>
BasicLinearRegression<Number>::Sums::Sums()
: x(0), y(0), xy(0), xSquared(0), ySquared(0)
{}

template <typename Number>
void BasicLinearRegression<Number>::Sums::add(StoredPoint const & point)
{
	x += point.x; y += point.y; xy += point.xy;
	xSquared += point.xSquared; ySquared += point.ySquared;
}

template <typename Number>
void BasicLinearRegression<Number>::Sums::subtract(StoredPoint const & point)
{
	x -= point.x; y -= point.y; xy -= point.xy;
	xSquared -= point.xSquared; ySquared -= point.ySquared;
}

template <typename Number>
BasicLinearRegression<Number>::BasicLinearRegression()
{}

template <typename Number>
BasicLinearRegression<Number>::BasicLinearRegression(Point const & point)
{
	push(point);
}

template <typename Number>
BasicLinearRegression<Number>::BasicLinearRegression(std::vector<Point> const & points)
{
	push(points);
}

template <typename Number>
void BasicLinearRegression<Number>::push(Point const & point)
{
	push(&point, &point + 1);
}

template <typename Number>
void BasicLinearRegression<Number>::push(std::vector<Point> const & points)
{
	push(points.begin(), points.end());
}

template <typename Number>
template <typename Iterator>
void BasicLinearRegression<Number>::push(Iterator first, Iterator last)
{
	if (first == last) return;
	fit = boost::none;
	for (; first != last; ++ first) {
		data.emplace_back(*first);
		sum.add(data.back());
	}
}

template <typename Number>
void BasicLinearRegression<Number>::shift()
{
	if (data.empty()) return;
	sum.subtract(data.front());
	data.pop_front();
	fit = boost::none;
}

template <typename Number>
BasicLinearRegression<Number> & BasicLinearRegression<Number>::calculate()
{
	if (data.size() < 2)
		throw NotEnoughDataError();

	number n(data.size());

	// a and b share a denominator
	//     (∑y)(∑x²) - (∑x)(∑xy)          n(∑xy) - (∑x)(∑y)
	// a = ---------------------      b = -----------------
	//        n(∑x²) - (∑x)²               n(∑x²) - (∑x)²
	number denom = n * sum.xSquared - sum.x * sum.x;

	Fit result;
	Coefficients & c = result.coefficients;
	c.a = divide(sum.y * sum.xSquared - sum.x * sum.xy, denom);
	c.b = divide(n * sum.xy - sum.x * sum.y, denom);

	// Deviations are taken from n times the mean, which stays exact where
	// the mean itself would be rounded.  The factors of n cancel in r.
	number sumResidualSquared = 0;
	number sumCross = 0;
	number sumDxSquared = 0;
	number sumDySquared = 0;
	for (auto & p : data) {
		number error = p.y - (c.b * p.x + c.a);
		number dx = n * p.x - sum.x;
		number dy = n * p.y - sum.y;
		sumResidualSquared += error * error;
		sumCross += dx * dy;
		sumDxSquared += dx * dx;
		sumDySquared += dy * dy;
	}

	// residual = sqrt(∑(y - (bx + a))² / (n - 2))
	result.stats.residual = boost::multiprecision::sqrt(divide(sumResidualSquared, n - 2));

	//            ∑(x - mean x)(y - mean y)
	// r = -------------------------------------
	//     sqrt(∑(x - mean x)² * ∑(y - mean y)²)
	number spread = boost::multiprecision::sqrt(sumDxSquared * sumDySquared);
	result.stats.pearsonsR = divide(sumCross, spread);

	fit = result;
	return *this;
}

template <typename Number>
Number BasicLinearRegression<Number>::a()
{
	return current().coefficients.a;
}

template <typename Number>
Number BasicLinearRegression<Number>::b()
{
	return current().coefficients.b;
}

template <typename Number>
Number BasicLinearRegression<Number>::value(number const & x)
{
	Coefficients const & c = current().coefficients;
	return c.b * x + c.a;
}

template <typename Number>
Number BasicLinearRegression<Number>::value(double x)
{
	return value(toNumber<number>(x));
}

template <typename Number>
Number BasicLinearRegression<Number>::residual(number const & multiplier)
{
	return current().stats.residual * multiplier;
}

template <typename Number>
Number BasicLinearRegression<Number>::residual(double multiplier)
{
	return residual(toNumber<number>(multiplier));
}

template <typename Number>
Number BasicLinearRegression<Number>::standardDeviation(number const & multiplier)
{
	return residual(multiplier);
}

template <typename Number>
Number BasicLinearRegression<Number>::standardDeviation(double multiplier)
{
	return residual(toNumber<number>(multiplier));
}

template <typename Number>
Number BasicLinearRegression<Number>::pearsonsR()
{
	return current().stats.pearsonsR;
}

template <typename Number>
Number BasicLinearRegression<Number>::standardDeviationValue(number const & x, number const & deviations)
{
	return value(x) + standardDeviation(deviations);
}

template <typename Number>
Number BasicLinearRegression<Number>::standardDeviationValue(double x, double deviations)
{
	return standardDeviationValue(toNumber<number>(x), toNumber<number>(deviations));
}

template <typename Number>
std::array<Number, 3> BasicLinearRegression<Number>::values(number const & x, number const & deviations)
{
	std::array<number, 3> ret = {{
		standardDeviationValue(x, -deviations),
		value(x),
		standardDeviationValue(x, deviations)
	}};
	return ret;
}

template <typename Number>
std::array<Number, 3> BasicLinearRegression<Number>::values(double x, double deviations)
{
	return values(toNumber<number>(x), toNumber<number>(deviations));
}

template <typename Number>
typename BasicLinearRegression<Number>::Fit const & BasicLinearRegression<Number>::current()
{
	if (!fit)
		calculate();
	return *fit;
}

template <typename Number>
Number BasicLinearRegression<Number>::divide(number const & dividend, number const & divisor)
{
	if (divisor == 0)
		throw DivisionByZeroError();
	return dividend / divisor;
}

extern template class BasicLinearRegression<decimal>;
extern template class BasicLinearRegression<binary>;

}
