// CPU kernels for surface texture decomposition
// This file is part of SurfaceTextureEngine
// Copyright (c) 2025 Miroslav Zabic

#ifndef STE_CPU_KERNELS_TPP
#define STE_CPU_KERNELS_TPP

#include <vector>
#include <complex>
#include <cmath>
#include <algorithm>
#include "fftw3.h"

namespace ste {
namespace cpu_kernels {

template <typename T>
void mirrorPad(
	const T* row,
	size_t rowLength,
	std::vector<T>& padded)
{
	padded.resize(3 * rowLength);

	// reversed | original | reversed
	std::reverse_copy(row, row + rowLength, padded.begin());
	std::copy(row, row + rowLength, padded.begin() + rowLength);
	std::reverse_copy(row, row + rowLength, padded.begin() + 2 * rowLength);
}

// Specialization for double using fftw
template <>
inline void computeFFT<double>(
	const std::vector<double>& input,
	std::vector<std::complex<double>>& output,
	void* fftPlan,
	void* fftIn,
	void* fftOut)
{
	fftw_plan plan = static_cast<fftw_plan>(fftPlan);
	fftw_complex* in = static_cast<fftw_complex*>(fftIn);
	fftw_complex* out = static_cast<fftw_complex*>(fftOut);

	size_t samples = input.size();

	// Real input, zero imaginary part
	for (size_t i = 0; i < samples; ++i) {
		in[i][0] = input[i];
		in[i][1] = 0.0;
	}

	fftw_execute(plan);

	output.resize(samples);
	for (size_t i = 0; i < samples; ++i) {
		output[i] = std::complex<double>(out[i][0], out[i][1]);
	}
}

// Specialization for double using fftw
template <>
inline void computeIFFT<double>(
	const std::vector<std::complex<double>>& input,
	std::vector<std::complex<double>>& output,
	void* fftPlan,
	void* fftIn,
	void* fftOut)
{
	fftw_plan plan = static_cast<fftw_plan>(fftPlan);
	fftw_complex* in = static_cast<fftw_complex*>(fftIn);
	fftw_complex* out = static_cast<fftw_complex*>(fftOut);

	size_t samples = input.size();

	for (size_t i = 0; i < samples; ++i) {
		in[i][0] = input[i].real();
		in[i][1] = input[i].imag();
	}

	fftw_execute(plan);

	// FFTW's backward transform is unnormalized
	output.resize(samples);
	double normFactor = 1.0 / static_cast<double>(samples);
	for (size_t i = 0; i < samples; ++i) {
		output[i] = std::complex<double>(out[i][0], out[i][1]) * normFactor;
	}
}

template <typename T>
void doubleInteriorBins(
	std::vector<std::complex<T>>& spectrum)
{
	// DC and the last bin keep their magnitude
	if (spectrum.size() < 3) {
		return;
	}
	for (size_t i = 1; i + 1 < spectrum.size(); ++i) {
		spectrum[i] *= static_cast<T>(2);
	}
}

template <typename T>
std::vector<T> computeWavelengthTable(
	size_t rowLength,
	T sampleWidth)
{
	// The padded sequence spans three sample widths
	std::vector<T> wavelengths(rowLength);
	const T paddedWidth = static_cast<T>(3) * sampleWidth;
	for (size_t j = 1; j <= rowLength; ++j) {
		wavelengths[j - 1] = static_cast<T>(2) * paddedWidth / static_cast<T>(j);
	}
	return wavelengths;
}

template <typename T>
int findStopIndex(
	const std::vector<T>& wavelengthTable,
	T cutoffWavelength)
{
	for (size_t i = 0; i < wavelengthTable.size(); ++i) {
		if (wavelengthTable[i] <= cutoffWavelength) {
			return static_cast<int>(i + 1);
		}
	}
	return -1;
}

template <typename T>
void lowPassFilter(
	std::vector<std::complex<T>>& spectrum,
	size_t stopIndex)
{
	// Zero [stopIndex, size - 1), the last bin stays untouched
	if (spectrum.empty()) {
		return;
	}
	const size_t last = spectrum.size() - 1;
	for (size_t i = stopIndex; i < last; ++i) {
		spectrum[i] = std::complex<T>(static_cast<T>(0), static_cast<T>(0));
	}
}

template <typename T>
void extractMiddleThird(
	const std::vector<std::complex<T>>& signal,
	size_t rowLength,
	T* output)
{
	for (size_t i = 0; i < rowLength; ++i) {
		output[i] = signal[rowLength + i].real();
	}
}

template <typename T>
void subtractRow(
	const T* primary,
	const T* waviness,
	size_t rowLength,
	T* roughness)
{
	for (size_t i = 0; i < rowLength; ++i) {
		roughness[i] = primary[i] - waviness[i];
	}
}

template <typename T>
T meanAbsolute(
	const T* row,
	size_t rowLength)
{
	if (rowLength == 0) {
		return static_cast<T>(0);
	}
	T sum = static_cast<T>(0);
	for (size_t i = 0; i < rowLength; ++i) {
		sum += std::abs(row[i]);
	}
	return sum / static_cast<T>(rowLength);
}

} // namespace cpu_kernels
} // namespace ste

#endif // STE_CPU_KERNELS_TPP
