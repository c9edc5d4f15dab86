#ifndef STE_BACKEND_INTERFACE_H
#define STE_BACKEND_INTERFACE_H

#include <complex>
#include <vector>
#include "../../include/decompositionconfiguration.h"
#include "../../include/profilegrid.h"
#include "../../include/types.h"

namespace ste {

// Abstract interface that all backends must implement
class ProcessingBackend {
public:
	virtual ~ProcessingBackend() = default;

	// Lifecycle
	virtual void initialize(const DecompositionConfiguration& config, int rowLength) = 0;
	virtual void cleanup() = 0;

	// Main pipeline stages. stopIndex is resolved once by the caller and
	// shared read-only by every row.
	virtual WavinessGrid computeWaviness(const ProfileGrid& primary, int stopIndex) = 0;
	virtual RoughnessGrid computeRoughness(const ProfileGrid& primary, const WavinessGrid& waviness) = 0;
	virtual MetricSeries computeMetrics(const WavinessGrid& waviness, const RoughnessGrid& roughness) = 0;

	// Individual operations for testing
	virtual std::vector<double> mirrorPad(const double* row, int rowLength) = 0;
	virtual std::vector<std::complex<double>> fft(const double* input, int length) = 0;
	virtual std::vector<double> ifft(const std::complex<double>* input, int length) = 0;
	virtual std::vector<double> filterRow(const double* row, int rowLength, int stopIndex) = 0;
};

} // namespace ste

#endif // STE_BACKEND_INTERFACE_H
