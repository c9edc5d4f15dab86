#ifndef STE_SURFACEPROCESSOR_H
#define STE_SURFACEPROCESSOR_H

#include <complex>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "decompositionconfiguration.h"
#include "profilegrid.h"
#include "surfacedecomposition.h"
#include "types.h"
#include "export.h"

namespace ste {

class STE_API SurfaceProcessor {
public:
	using WarningCallback = std::function<void(const std::string&)>;

	// Construction
	SurfaceProcessor();
	explicit SurfaceProcessor(const DecompositionConfiguration& config);
	~SurfaceProcessor();

	SurfaceProcessor(const SurfaceProcessor&) = delete;
	SurfaceProcessor& operator=(const SurfaceProcessor&) = delete;

	// Create FFT plans and workers for rows of the given length.
	// OPTIONAL - automatically called by decompose() when the row length or
	// thread count differs from the last initialization.
	void initialize(int rowLength);

	// Free FFT plans and buffers
	void cleanup();

	bool isInitialized() const;

	void loadConfigurationFromFile(const std::string& filepath);
	void saveConfigurationToFile(const std::string& filepath) const;

	const DecompositionConfiguration& getConfig() const;
	void setConfig(const DecompositionConfiguration& config);

	void setCutoffWavelength(double cutoffWavelength);
	void setSampleWidth(double sampleWidth);
	void setThreadCount(int threads);
	void setStrictShape(bool strict);
	void setDelimiter(char delimiter);

	// Receives non-fatal diagnostics, e.g. truncated non-square input.
	// Without a callback such diagnostics are dropped.
	void setWarningCallback(WarningCallback callback);

	// ============================================
	// PIPELINE
	// ============================================

	// Reshape samples according to the input parameters
	ProfileGrid createProfileGrid(const std::vector<double>& samples);
	ProfileGrid loadProfileGrid(const std::string& filepath);

	// primary -> waviness -> roughness -> metrics
	SurfaceDecomposition decompose(const ProfileGrid& primary);
	SurfaceDecomposition decomposeSamples(const std::vector<double>& samples);
	SurfaceDecomposition decomposeFile(const std::string& filepath);

	// ============================================
	// LOW-LEVEL API - Individual Operations (for testing)
	// ============================================

	// Candidate wavelength for frequency index j = 1..rowLength
	std::vector<double> computeWavelengthTable(int rowLength) const;

	// First index whose wavelength is <= cutoff.
	// Throws DegenerateRowError or CutoffUnreachableError.
	int findStopIndex(int rowLength) const;

	// reversed | row | reversed
	std::vector<double> mirrorPad(const double* row, int rowLength);

	std::vector<std::complex<double>> fft(const double* input, int length);

	// Normalized inverse transform, real part only
	std::vector<double> ifft(const std::complex<double>* input, int length);

	Row filterRow(const Row& row);

	WavinessGrid computeWaviness(const ProfileGrid& primary);

	RoughnessGrid extractRoughness(const ProfileGrid& primary, const WavinessGrid& waviness);

	MetricSeries computeMetrics(const WavinessGrid& waviness, const RoughnessGrid& roughness);

private:
	class Impl;
	std::unique_ptr<Impl> impl;
};

} // namespace ste

#endif // STE_SURFACEPROCESSOR_H
