#pragma once

#include <vector>

namespace facesharp::analysis::core {

//! Arithmetic mean. 0 for an empty list.
double mean(const std::vector<double>& v);

} // namespace facesharp::analysis::core
