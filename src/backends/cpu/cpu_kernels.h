#ifndef STE_CPU_KERNELS_H
#define STE_CPU_KERNELS_H

#include <vector>
#include <complex>
#include <cstddef>

namespace ste {
namespace cpu_kernels {


template <typename T>
void mirrorPad(
	const T* row,
	size_t rowLength,
	std::vector<T>& padded
);

template <typename T>
void computeFFT(
	const std::vector<T>& input,
	std::vector<std::complex<T>>& output,
	void* fftPlan,
	void* fftIn,
	void* fftOut
);

template <typename T>
void computeIFFT(
	const std::vector<std::complex<T>>& input,
	std::vector<std::complex<T>>& output,
	void* fftPlan,
	void* fftIn,
	void* fftOut
);

template <typename T>
void doubleInteriorBins(
	std::vector<std::complex<T>>& spectrum
);

template <typename T>
std::vector<T> computeWavelengthTable(
	size_t rowLength,
	T sampleWidth
);

template <typename T>
int findStopIndex(
	const std::vector<T>& wavelengthTable,
	T cutoffWavelength
);

template <typename T>
void lowPassFilter(
	std::vector<std::complex<T>>& spectrum,
	size_t stopIndex
);

template <typename T>
void extractMiddleThird(
	const std::vector<std::complex<T>>& signal,
	size_t rowLength,
	T* output
);

template <typename T>
void subtractRow(
	const T* primary,
	const T* waviness,
	size_t rowLength,
	T* roughness
);

template <typename T>
T meanAbsolute(
	const T* row,
	size_t rowLength
);

} // namespace cpu_kernels
} // namespace ste

// Include template implementations
#include "cpu_kernels.tpp"

#endif // STE_CPU_KERNELS_H
