#include "cpu_backend.h"
#include "cpu_kernels.h"
#include "../../../include/errors.h"
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace ste {

namespace {

// FFTW's planner is not thread-safe, only fftw_execute is
std::mutex plannerMutex;

// Plans and buffers for one transform length. Each worker owns one, so
// rows can be transformed concurrently without sharing buffers.
struct FftWorkspace {
	int length;
	fftw_complex* fftIn;
	fftw_complex* fftOut;
	fftw_plan forwardPlan;
	fftw_plan backwardPlan;

	explicit FftWorkspace(int length)
		: length(length)
		, fftIn(nullptr)
		, fftOut(nullptr)
		, forwardPlan(nullptr)
		, backwardPlan(nullptr)
	{
		std::lock_guard<std::mutex> lock(plannerMutex);

		this->fftIn = fftw_alloc_complex(length);
		this->fftOut = fftw_alloc_complex(length);
		if (!this->fftIn || !this->fftOut) {
			this->release();
			throw BackendError("Failed to allocate FFTW buffers");
		}

		this->forwardPlan = fftw_plan_dft_1d(length, this->fftIn, this->fftOut, FFTW_FORWARD, FFTW_ESTIMATE);
		this->backwardPlan = fftw_plan_dft_1d(length, this->fftIn, this->fftOut, FFTW_BACKWARD, FFTW_ESTIMATE);
		if (!this->forwardPlan || !this->backwardPlan) {
			this->release();
			throw BackendError("Failed to create FFTW plan of length " + std::to_string(length));
		}
	}

	~FftWorkspace() {
		std::lock_guard<std::mutex> lock(plannerMutex);
		this->release();
	}

	FftWorkspace(const FftWorkspace&) = delete;
	FftWorkspace& operator=(const FftWorkspace&) = delete;

	// Caller holds plannerMutex
	void release() {
		if (this->forwardPlan) {
			fftw_destroy_plan(this->forwardPlan);
			this->forwardPlan = nullptr;
		}
		if (this->backwardPlan) {
			fftw_destroy_plan(this->backwardPlan);
			this->backwardPlan = nullptr;
		}
		if (this->fftIn) {
			fftw_free(this->fftIn);
			this->fftIn = nullptr;
		}
		if (this->fftOut) {
			fftw_free(this->fftOut);
			this->fftOut = nullptr;
		}
	}
};

void checkRowArguments(const double* row, int rowLength, int stopIndex) {
	if (!row) {
		throw std::invalid_argument("Row data is null");
	}
	if (rowLength < 2) {
		throw DegenerateRowError("Row length " + std::to_string(rowLength) + " is too short to filter, at least 2 samples are required");
	}
	if (stopIndex < 1 || stopIndex >= 3 * rowLength) {
		throw std::invalid_argument("Stop index " + std::to_string(stopIndex) + " outside of padded spectrum");
	}
}

} // namespace

// ============================================
// Internal implementation
// ============================================

struct CpuBackend::Impl {
	int rowLength;
	bool initialized;
	WorkerLauncher launchWorker;

	// One workspace per worker thread, sized for the padded row (3N)
	std::vector<std::unique_ptr<FftWorkspace>> workspaces;

	Impl()
		: rowLength(0)
		, initialized(false)
		, launchWorker(defaultWorkerLauncher)
	{}

	static std::thread defaultWorkerLauncher(std::function<void()> task) {
		return std::thread(std::move(task));
	}

	// Mirror pad, transform, double, low-pass, reconstruct, crop
	void filterRowInto(FftWorkspace& workspace, const double* row, int length, int stopIndex, double* output) {
		std::vector<double> padded;
		cpu_kernels::mirrorPad<double>(row, static_cast<size_t>(length), padded);

		std::vector<std::complex<double>> spectrum;
		cpu_kernels::computeFFT<double>(
			padded,
			spectrum,
			workspace.forwardPlan,
			workspace.fftIn,
			workspace.fftOut
		);

		cpu_kernels::doubleInteriorBins<double>(spectrum);
		cpu_kernels::lowPassFilter<double>(spectrum, static_cast<size_t>(stopIndex));

		std::vector<std::complex<double>> reconstructed;
		cpu_kernels::computeIFFT<double>(
			spectrum,
			reconstructed,
			workspace.backwardPlan,
			workspace.fftIn,
			workspace.fftOut
		);

		cpu_kernels::extractMiddleThird<double>(reconstructed, static_cast<size_t>(length), output);
	}

	void filterRowsSequential(const ProfileGrid& primary, int stopIndex, std::vector<double>& output) {
		const int n = primary.getDimension();
		for (int row = 0; row < n; ++row) {
			this->filterRowInto(*this->workspaces[0], primary.getRowPointer(row), n, stopIndex, output.data() + static_cast<size_t>(row) * n);
		}
	}

	// Rows are handed out through an atomic counter. Every row writes its
	// own slice of the output, so the only synchronization is the join.
	// Workers keep taking rows until none are left, so if only some of them
	// start, those still cover the whole grid.
	void filterRowsParallel(const ProfileGrid& primary, int stopIndex, int numWorkers, std::vector<double>& output) {
		const int n = primary.getDimension();
		std::atomic<int> nextRow(0);
		std::vector<std::exception_ptr> errors(numWorkers);
		std::vector<std::thread> workers;
		workers.reserve(numWorkers);
		std::string launchError;

		for (int w = 0; w < numWorkers; ++w) {
			try {
				workers.push_back(this->launchWorker([this, &primary, &nextRow, &errors, &output, stopIndex, n, w]() {
					try {
						FftWorkspace& workspace = *this->workspaces[w];
						for (int row = nextRow++; row < n; row = nextRow++) {
							this->filterRowInto(workspace, primary.getRowPointer(row), n, stopIndex, output.data() + static_cast<size_t>(row) * n);
						}
					} catch (...) {
						errors[w] = std::current_exception();
					}
				}));
			} catch (const std::exception& e) {
				launchError = e.what();
				break;
			}
		}

		int started = 0;
		for (auto& worker : workers) {
			if (worker.joinable()) {
				worker.join();
				++started;
			}
		}

		if (started == 0) {
			throw BackendError("Failed to start row workers: " + launchError);
		}

		for (const auto& error : errors) {
			if (error) {
				std::rethrow_exception(error);
			}
		}
	}
};

// ============================================
// CpuBackend Implementation
// ============================================

CpuBackend::CpuBackend() : impl(std::make_unique<Impl>()) {
}

CpuBackend::~CpuBackend() {
	this->cleanup();
}

void CpuBackend::initialize(const DecompositionConfiguration& config, int rowLength) {
	if (rowLength < 2) {
		throw DegenerateRowError("Cannot initialize backend for row length " + std::to_string(rowLength));
	}

	this->cleanup();
	this->impl->rowLength = rowLength;

	// More workers than rows would only hold idle plans
	int numWorkers = std::max(1, std::min(config.processingParams.getEffectiveThreadCount(), rowLength));
	const int paddedLength = 3 * rowLength;
	for (int i = 0; i < numWorkers; ++i) {
		this->impl->workspaces.push_back(std::make_unique<FftWorkspace>(paddedLength));
	}

	this->impl->initialized = true;
}

void CpuBackend::cleanup() {
	this->impl->workspaces.clear();
	this->impl->rowLength = 0;
	this->impl->initialized = false;
}

WavinessGrid CpuBackend::computeWaviness(const ProfileGrid& primary, int stopIndex) {
	const int n = primary.getDimension();
	if (!this->impl->initialized || this->impl->rowLength != n) {
		throw BackendError("Backend is not initialized for row length " + std::to_string(n));
	}
	checkRowArguments(primary.getRowPointer(0), n, stopIndex);

	std::vector<double> waviness(static_cast<size_t>(n) * n);
	const int numWorkers = static_cast<int>(this->impl->workspaces.size());
	if (numWorkers <= 1) {
		this->impl->filterRowsSequential(primary, stopIndex, waviness);
	} else {
		this->impl->filterRowsParallel(primary, stopIndex, numWorkers, waviness);
	}

	return WavinessGrid(n, std::move(waviness));
}

RoughnessGrid CpuBackend::computeRoughness(const ProfileGrid& primary, const WavinessGrid& waviness) {
	const int n = primary.getDimension();
	if (waviness.getDimension() != n) {
		throw std::invalid_argument("Primary and waviness grids differ in size");
	}

	std::vector<double> roughness(static_cast<size_t>(n) * n);
	for (int row = 0; row < n; ++row) {
		cpu_kernels::subtractRow<double>(
			primary.getRowPointer(row),
			waviness.getRowPointer(row),
			static_cast<size_t>(n),
			roughness.data() + static_cast<size_t>(row) * n
		);
	}

	return RoughnessGrid(n, std::move(roughness));
}

MetricSeries CpuBackend::computeMetrics(const WavinessGrid& waviness, const RoughnessGrid& roughness) {
	const int n = waviness.getDimension();
	if (roughness.getDimension() != n) {
		throw std::invalid_argument("Waviness and roughness grids differ in size");
	}

	std::vector<double> wa(n);
	std::vector<double> ra(n);
	for (int row = 0; row < n; ++row) {
		wa[row] = cpu_kernels::meanAbsolute<double>(waviness.getRowPointer(row), static_cast<size_t>(n));
		ra[row] = cpu_kernels::meanAbsolute<double>(roughness.getRowPointer(row), static_cast<size_t>(n));
	}

	MetricSeries metrics;
	metrics[getMetricName(MetricType::WA)] = std::move(wa);
	metrics[getMetricName(MetricType::RA)] = std::move(ra);
	return metrics;
}

// ============================================
// Individual operations
// ============================================

std::vector<double> CpuBackend::mirrorPad(const double* row, int rowLength) {
	if (!row || rowLength <= 0) {
		throw std::invalid_argument("Row data is empty");
	}
	std::vector<double> padded;
	cpu_kernels::mirrorPad<double>(row, static_cast<size_t>(rowLength), padded);
	return padded;
}

std::vector<std::complex<double>> CpuBackend::fft(const double* input, int length) {
	if (!input || length <= 0) {
		throw std::invalid_argument("FFT input is empty");
	}

	FftWorkspace workspace(length);
	std::vector<double> signal(input, input + length);
	std::vector<std::complex<double>> spectrum;
	cpu_kernels::computeFFT<double>(
		signal,
		spectrum,
		workspace.forwardPlan,
		workspace.fftIn,
		workspace.fftOut
	);
	return spectrum;
}

std::vector<double> CpuBackend::ifft(const std::complex<double>* input, int length) {
	if (!input || length <= 0) {
		throw std::invalid_argument("IFFT input is empty");
	}

	FftWorkspace workspace(length);
	std::vector<std::complex<double>> spectrum(input, input + length);
	std::vector<std::complex<double>> signal;
	cpu_kernels::computeIFFT<double>(
		spectrum,
		signal,
		workspace.backwardPlan,
		workspace.fftIn,
		workspace.fftOut
	);

	std::vector<double> output(length);
	for (int i = 0; i < length; ++i) {
		output[i] = signal[i].real();
	}
	return output;
}

std::vector<double> CpuBackend::filterRow(const double* row, int rowLength, int stopIndex) {
	checkRowArguments(row, rowLength, stopIndex);

	std::vector<double> output(rowLength);
	if (this->impl->initialized && this->impl->rowLength == rowLength) {
		this->impl->filterRowInto(*this->impl->workspaces[0], row, rowLength, stopIndex, output.data());
	} else {
		FftWorkspace workspace(3 * rowLength);
		this->impl->filterRowInto(workspace, row, rowLength, stopIndex, output.data());
	}
	return output;
}

void CpuBackend::setWorkerLauncher(WorkerLauncher launcher) {
	if (!launcher) {
		throw std::invalid_argument("Worker launcher must not be empty");
	}
	this->impl->launchWorker = std::move(launcher);
}

} // namespace ste
