#ifndef STE_TYPES_H
#define STE_TYPES_H

#include <map>
#include <string>
#include <vector>
#include "export.h"

namespace ste {

// One scan line of height samples
using Row = std::vector<double>;

// Metric name ("Wa", "Ra") -> one value per row
using MetricSeries = std::map<std::string, std::vector<double>>;

enum class MetricType {
	WA = 0, // mean absolute waviness
	RA = 1  // mean absolute roughness
};

STE_API std::string getMetricName(MetricType type);

// Accepts "Wa"/"Ra" (case-insensitive), throws std::invalid_argument otherwise
STE_API MetricType parseMetricName(const std::string& name);

} // namespace ste

#endif // STE_TYPES_H
