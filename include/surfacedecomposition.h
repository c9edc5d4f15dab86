#ifndef STE_SURFACEDECOMPOSITION_H
#define STE_SURFACEDECOMPOSITION_H

#include <vector>
#include "profilegrid.h"
#include "types.h"
#include "export.h"

namespace ste {

// Cross section of one row, x positions span [0, sampleWidth]
struct STE_API SectionProfile {
	int rowIndex;
	std::vector<double> position;
	Row primary;
	Row waviness;
	Row roughness;

	SectionProfile() : rowIndex(0) {}
};

// Result of one decomposition run. Holds the primary grid it was computed
// from together with the derived grids, metrics and the filter settings.
class STE_API SurfaceDecomposition {
public:
	SurfaceDecomposition(
		ProfileGrid primary,
		WavinessGrid waviness,
		RoughnessGrid roughness,
		MetricSeries metrics,
		double cutoffWavelength,
		double sampleWidth,
		int stopIndex
	);

	const ProfileGrid& getPrimary() const;
	const WavinessGrid& getWaviness() const;
	const RoughnessGrid& getRoughness() const;
	const MetricSeries& getMetrics() const;

	// Per-row series for Wa or Ra
	const std::vector<double>& getMetric(MetricType type) const;

	// Series minus its own mean, for plotting around zero
	std::vector<double> getCenteredMetric(MetricType type) const;

	SectionProfile getSection(int rowIndex) const;

	// N evenly spaced positions from 0 to sampleWidth
	std::vector<double> getPositions() const;

	int getDimension() const;
	double getCutoffWavelength() const;
	double getSampleWidth() const;
	int getStopIndex() const;

private:
	ProfileGrid primary;
	WavinessGrid waviness;
	RoughnessGrid roughness;
	MetricSeries metrics;
	double cutoffWavelength;
	double sampleWidth;
	int stopIndex;
};

} // namespace ste

#endif // STE_SURFACEDECOMPOSITION_H
