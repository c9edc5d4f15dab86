#include "../../include/types.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ste {

std::string getMetricName(MetricType type) {
	switch (type) {
	case MetricType::WA:
		return "Wa";
	case MetricType::RA:
		return "Ra";
	default:
		throw std::invalid_argument("Unknown metric type");
	}
}

MetricType parseMetricName(const std::string& name) {
	std::string lower = name;
	std::transform(lower.begin(), lower.end(), lower.begin(),
		[](unsigned char c) { return static_cast<char>(std::tolower(c)); });

	if (lower == "wa") {
		return MetricType::WA;
	}
	if (lower == "ra") {
		return MetricType::RA;
	}
	throw std::invalid_argument("Unknown metric name: " + name);
}

} // namespace ste
