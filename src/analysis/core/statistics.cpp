#include "statistics.hpp"

#include <numeric>

namespace facesharp::analysis::core {

double mean(const std::vector<double>& v) {
	if (v.empty()) {
		return 0.0;
	}
	return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

} // namespace facesharp::analysis::core
