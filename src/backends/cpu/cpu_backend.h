#ifndef STE_CPU_BACKEND_H
#define STE_CPU_BACKEND_H

#include "../backend_interface.h"
#include "fftw3.h"
#include <functional>
#include <memory>
#include <thread>
#include <vector>
#include <complex>

namespace ste {

class CpuBackend : public ProcessingBackend {
public:
	// Starts one row worker. Replaceable to exercise thread start failures.
	using WorkerLauncher = std::function<std::thread(std::function<void()>)>;

	CpuBackend();
	~CpuBackend() override;

	void initialize(const DecompositionConfiguration& config, int rowLength) override;
	void cleanup() override;

	WavinessGrid computeWaviness(const ProfileGrid& primary, int stopIndex) override;
	RoughnessGrid computeRoughness(const ProfileGrid& primary, const WavinessGrid& waviness) override;
	MetricSeries computeMetrics(const WavinessGrid& waviness, const RoughnessGrid& roughness) override;

	// Individual operations
	std::vector<double> mirrorPad(const double* row, int rowLength) override;
	std::vector<std::complex<double>> fft(const double* input, int length) override;
	std::vector<double> ifft(const std::complex<double>* input, int length) override;
	std::vector<double> filterRow(const double* row, int rowLength, int stopIndex) override;

	void setWorkerLauncher(WorkerLauncher launcher);

private:
	struct Impl;
	std::unique_ptr<Impl> impl;
};

} // namespace ste

#endif // STE_CPU_BACKEND_H
