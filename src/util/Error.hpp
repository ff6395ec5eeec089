#pragma once

#include <stdexcept>
#include <string>

namespace trendline {

// Fewer than two points.
class NotEnoughDataError : public std::runtime_error
{
public:
	NotEnoughDataError(std::string message = "Not enough data to fit a line.")
	: std::runtime_error(message)
	{ }
};

// Degenerate points, including exactly two of them.
class DivisionByZeroError : public std::overflow_error
{
public:
	DivisionByZeroError(std::string message = "Division by zero.")
	: std::overflow_error(message)
	{ }
};

}
