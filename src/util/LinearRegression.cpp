#include "util/LinearRegression.hpp"

namespace trendline {

template class BasicLinearRegression<decimal>;
template class BasicLinearRegression<binary>;

}
