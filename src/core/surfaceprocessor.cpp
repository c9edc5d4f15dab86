#include "../../include/surfaceprocessor.h"
#include "../../include/errors.h"
#include "../../include/surfaceio.h"
#include "../backends/backend_interface.h"
#include "../backends/cpu/cpu_backend.h"
#include "../backends/cpu/cpu_kernels.h"
#include <sstream>
#include <stdexcept>

namespace ste {

// ============================================
// PIMPL Implementation - All logic here!
// ============================================

class SurfaceProcessor::Impl {
public:
	DecompositionConfiguration config;
	std::unique_ptr<ProcessingBackend> backend;
	WarningCallback warningCallback;

	bool initialized = false;
	int lastInitializedRowLength = 0;
	int lastInitializedThreads = 0;

	Impl() : backend(std::make_unique<CpuBackend>()) {}

	~Impl() {
		if (this->backend && this->initialized) {
			this->backend->cleanup();
		}
	}

	void warn(const std::string& message) const {
		if (this->warningCallback) {
			this->warningCallback(message);
		}
	}

	void checkConfig() const {
		if (!this->config.validate()) {
			std::ostringstream msg;
			msg << "Invalid decomposition configuration (cutoff=" << this->config.filterParams.cutoffWavelength
				<< ", sample_width=" << this->config.filterParams.sampleWidth
				<< ", threads=" << this->config.processingParams.threads
				<< ", delimiter='" << this->config.inputParams.delimiter << "')";
			throw ConfigurationError(msg.str());
		}
	}

	void initialize(int rowLength) {
		this->checkConfig();
		this->backend->initialize(this->config, rowLength);
		this->initialized = true;
		this->lastInitializedRowLength = rowLength;
		this->lastInitializedThreads = this->config.processingParams.threads;
	}

	void cleanup() {
		if (this->initialized) {
			this->backend->cleanup();
			this->initialized = false;
		}
	}

	bool needsReinit(int rowLength) const {
		return !this->initialized ||
		       rowLength != this->lastInitializedRowLength ||
		       this->config.processingParams.threads != this->lastInitializedThreads;
	}

	void ensureInitialized(int rowLength) {
		if (this->needsReinit(rowLength)) {
			this->initialize(rowLength);
		}
	}

	std::vector<double> wavelengthTable(int rowLength) const {
		if (rowLength < 0) {
			throw std::invalid_argument("Row length must not be negative");
		}
		return cpu_kernels::computeWavelengthTable<double>(
			static_cast<size_t>(rowLength),
			this->config.filterParams.sampleWidth
		);
	}

	// Depends only on (rowLength, cutoff, sampleWidth), resolved once per
	// decomposition and passed by value to every row
	int resolveStopIndex(int rowLength) const {
		this->checkConfig();
		if (rowLength < 2) {
			throw DegenerateRowError("Row length " + std::to_string(rowLength) +
				" is too short to compute a stop index, at least 2 samples are required");
		}

		std::vector<double> table = this->wavelengthTable(rowLength);
		int stopIndex = cpu_kernels::findStopIndex<double>(table, this->config.filterParams.cutoffWavelength);
		if (stopIndex < 0) {
			std::ostringstream msg;
			msg << "Cutoff wavelength " << this->config.filterParams.cutoffWavelength
				<< " is below the shortest resolvable wavelength " << table.back()
				<< " for row length " << rowLength
				<< " and sample width " << this->config.filterParams.sampleWidth;
			throw CutoffUnreachableError(msg.str());
		}
		return stopIndex;
	}

	ProfileGrid createProfileGrid(const std::vector<double>& samples) const {
		ProfileGrid grid = ProfileGrid::fromSamples(samples, this->config.inputParams.strictShape);
		if (grid.getDiscardedSampleCount() > 0) {
			std::ostringstream msg;
			msg << "Sample count " << samples.size() << " is not a perfect square; using a "
				<< grid.getDimension() << "x" << grid.getDimension() << " grid and discarding "
				<< grid.getDiscardedSampleCount() << " trailing samples";
			this->warn(msg.str());
		}
		return grid;
	}
};

// ============================================
// PUBLIC API - Thin wrappers
// ============================================

SurfaceProcessor::SurfaceProcessor()
	: impl(std::make_unique<Impl>())
{
}

SurfaceProcessor::SurfaceProcessor(const DecompositionConfiguration& config)
	: impl(std::make_unique<Impl>())
{
	this->impl->config = config;
}

SurfaceProcessor::~SurfaceProcessor() = default;

// ============================================
// LIFECYCLE
// ============================================

void SurfaceProcessor::initialize(int rowLength) {
	this->impl->initialize(rowLength);
}

void SurfaceProcessor::cleanup() {
	this->impl->cleanup();
}

bool SurfaceProcessor::isInitialized() const {
	return this->impl->initialized;
}

// ============================================
// CONFIGURATION
// ============================================

void SurfaceProcessor::loadConfigurationFromFile(const std::string& filepath) {
	if (!this->impl->config.loadFromFile(filepath)) {
		throw ConfigurationError("Failed to load configuration from: " + filepath);
	}
}

void SurfaceProcessor::saveConfigurationToFile(const std::string& filepath) const {
	if (!this->impl->config.saveToFile(filepath)) {
		throw ConfigurationError("Failed to save configuration to: " + filepath);
	}
}

const DecompositionConfiguration& SurfaceProcessor::getConfig() const {
	return this->impl->config;
}

// Filter parameters are read per decomposition, only a thread count
// change requires new FFT workspaces (handled lazily by needsReinit)
void SurfaceProcessor::setConfig(const DecompositionConfiguration& config) {
	this->impl->config = config;
}

void SurfaceProcessor::setCutoffWavelength(double cutoffWavelength) {
	this->impl->config.filterParams.cutoffWavelength = cutoffWavelength;
}

void SurfaceProcessor::setSampleWidth(double sampleWidth) {
	this->impl->config.filterParams.sampleWidth = sampleWidth;
}

void SurfaceProcessor::setThreadCount(int threads) {
	this->impl->config.processingParams.threads = threads;
}

void SurfaceProcessor::setStrictShape(bool strict) {
	this->impl->config.inputParams.strictShape = strict;
}

void SurfaceProcessor::setDelimiter(char delimiter) {
	this->impl->config.inputParams.delimiter = delimiter;
}

void SurfaceProcessor::setWarningCallback(WarningCallback callback) {
	this->impl->warningCallback = std::move(callback);
}

// ============================================
// PIPELINE
// ============================================

ProfileGrid SurfaceProcessor::createProfileGrid(const std::vector<double>& samples) {
	return this->impl->createProfileGrid(samples);
}

ProfileGrid SurfaceProcessor::loadProfileGrid(const std::string& filepath) {
	this->impl->checkConfig();
	std::vector<double> samples = readSurfaceSamples(filepath, this->impl->config.inputParams.delimiter);
	return this->impl->createProfileGrid(samples);
}

SurfaceDecomposition SurfaceProcessor::decompose(const ProfileGrid& primary) {
	const int n = primary.getDimension();
	const int stopIndex = this->impl->resolveStopIndex(n);

	this->impl->ensureInitialized(n);

	WavinessGrid waviness = this->impl->backend->computeWaviness(primary, stopIndex);
	RoughnessGrid roughness = this->impl->backend->computeRoughness(primary, waviness);
	MetricSeries metrics = this->impl->backend->computeMetrics(waviness, roughness);

	return SurfaceDecomposition(
		primary,
		std::move(waviness),
		std::move(roughness),
		std::move(metrics),
		this->impl->config.filterParams.cutoffWavelength,
		this->impl->config.filterParams.sampleWidth,
		stopIndex
	);
}

SurfaceDecomposition SurfaceProcessor::decomposeSamples(const std::vector<double>& samples) {
	return this->decompose(this->createProfileGrid(samples));
}

SurfaceDecomposition SurfaceProcessor::decomposeFile(const std::string& filepath) {
	return this->decompose(this->loadProfileGrid(filepath));
}

// ============================================
// LOW-LEVEL API
// ============================================

std::vector<double> SurfaceProcessor::computeWavelengthTable(int rowLength) const {
	return this->impl->wavelengthTable(rowLength);
}

int SurfaceProcessor::findStopIndex(int rowLength) const {
	return this->impl->resolveStopIndex(rowLength);
}

std::vector<double> SurfaceProcessor::mirrorPad(const double* row, int rowLength) {
	return this->impl->backend->mirrorPad(row, rowLength);
}

std::vector<std::complex<double>> SurfaceProcessor::fft(const double* input, int length) {
	return this->impl->backend->fft(input, length);
}

std::vector<double> SurfaceProcessor::ifft(const std::complex<double>* input, int length) {
	return this->impl->backend->ifft(input, length);
}

Row SurfaceProcessor::filterRow(const Row& row) {
	const int n = static_cast<int>(row.size());
	const int stopIndex = this->impl->resolveStopIndex(n);
	return this->impl->backend->filterRow(row.data(), n, stopIndex);
}

WavinessGrid SurfaceProcessor::computeWaviness(const ProfileGrid& primary) {
	const int n = primary.getDimension();
	const int stopIndex = this->impl->resolveStopIndex(n);
	this->impl->ensureInitialized(n);
	return this->impl->backend->computeWaviness(primary, stopIndex);
}

RoughnessGrid SurfaceProcessor::extractRoughness(const ProfileGrid& primary, const WavinessGrid& waviness) {
	return this->impl->backend->computeRoughness(primary, waviness);
}

MetricSeries SurfaceProcessor::computeMetrics(const WavinessGrid& waviness, const RoughnessGrid& roughness) {
	return this->impl->backend->computeMetrics(waviness, roughness);
}

} // namespace ste
