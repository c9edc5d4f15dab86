#include "../include/surfaceprocessor.h"
#include "../include/errors.h"
#include <algorithm>
#include <cmath>
#include <complex>
#include <iostream>
#include <random>
#include <vector>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

const double TOLERANCE = 1e-9;

bool allTestsPassed = true;
int testCounter = 0;

#define TEST_SECTION(name) \
	std::cout << "\n========================================" << std::endl; \
	std::cout << "TEST SECTION " << (++testCounter) << ": " << name << std::endl; \
	std::cout << "========================================" << std::endl;

#define ASSERT_TRUE(condition, message) \
	if (!(condition)) { \
		std::cerr << "  FAIL: " << message << std::endl; \
		allTestsPassed = false; \
	} else { \
		std::cout << "  PASS: " << message << std::endl; \
	}

#define ASSERT_EQUAL(val1, val2, message) \
	if ((val1) != (val2)) { \
		std::cerr << "  FAIL: " << message << " (expected " << (val2) << ", got " << (val1) << ")" << std::endl; \
		allTestsPassed = false; \
	} else { \
		std::cout << "  PASS: " << message << std::endl; \
	}

#define ASSERT_NEAR(val1, val2, tol, message) \
	if (std::abs((val1) - (val2)) > (tol)) { \
		std::cerr << "  FAIL: " << message << " (expected " << (val2) << ", got " << (val1) << ")" << std::endl; \
		allTestsPassed = false; \
	} else { \
		std::cout << "  PASS: " << message << std::endl; \
	}

#define ASSERT_THROWS(statement, exceptionType, message) \
	{ \
		bool thrown = false; \
		try { \
			statement; \
		} catch (const exceptionType&) { \
			thrown = true; \
		} \
		ASSERT_TRUE(thrown, message); \
	}

double maxAbsDifference(const std::vector<double>& a, const std::vector<double>& b) {
	if (a.size() != b.size()) {
		return INFINITY;
	}
	double maxDiff = 0.0;
	for (size_t i = 0; i < a.size(); ++i) {
		maxDiff = std::max(maxDiff, std::abs(a[i] - b[i]));
	}
	return maxDiff;
}

// Direct O(n^2) DFT version of the waviness filter
std::vector<double> referenceWaviness(const std::vector<double>& row, double cutoff, double sampleWidth) {
	const size_t n = row.size();
	const size_t m = 3 * n;

	std::vector<double> padded;
	padded.insert(padded.end(), row.rbegin(), row.rend());
	padded.insert(padded.end(), row.begin(), row.end());
	padded.insert(padded.end(), row.rbegin(), row.rend());

	std::vector<std::complex<double>> spectrum(m);
	for (size_t k = 0; k < m; ++k) {
		std::complex<double> sum(0.0, 0.0);
		for (size_t t = 0; t < m; ++t) {
			double angle = -2.0 * M_PI * static_cast<double>(k * t) / static_cast<double>(m);
			sum += padded[t] * std::complex<double>(std::cos(angle), std::sin(angle));
		}
		spectrum[k] = sum;
	}

	for (size_t k = 1; k + 1 < m; ++k) {
		spectrum[k] *= 2.0;
	}

	size_t stop = 0;
	for (size_t j = 1; j <= n; ++j) {
		if (2.0 * (3.0 * sampleWidth) / static_cast<double>(j) <= cutoff) {
			stop = j;
			break;
		}
	}
	for (size_t k = stop; k + 1 < m; ++k) {
		spectrum[k] = 0.0;
	}

	std::vector<double> waviness(n);
	for (size_t i = 0; i < n; ++i) {
		const size_t t = n + i;
		std::complex<double> sum(0.0, 0.0);
		for (size_t k = 0; k < m; ++k) {
			double angle = 2.0 * M_PI * static_cast<double>((k * t) % m) / static_cast<double>(m);
			sum += spectrum[k] * std::complex<double>(std::cos(angle), std::sin(angle));
		}
		waviness[i] = sum.real() / static_cast<double>(m);
	}
	return waviness;
}

std::vector<double> randomRow(size_t length, unsigned int seed) {
	std::mt19937 generator(seed);
	std::uniform_real_distribution<double> distribution(-2.0, 2.0);
	std::vector<double> row(length);
	for (size_t i = 0; i < length; ++i) {
		// Tilted, wavy and noisy like a real scan line
		double x = static_cast<double>(i) / static_cast<double>(length);
		row[i] = 10.0 + 3.0 * x + 1.5 * std::sin(2.0 * M_PI * x) + 0.2 * distribution(generator);
	}
	return row;
}

int main() {
	std::cout << "Testing row spectrum filter..." << std::endl;

	TEST_SECTION("Mirror padding");
	{
		ste::SurfaceProcessor processor;
		std::vector<double> row = {1.0, 2.0, 3.0};
		std::vector<double> padded = processor.mirrorPad(row.data(), 3);
		std::vector<double> expected = {3.0, 2.0, 1.0, 1.0, 2.0, 3.0, 3.0, 2.0, 1.0};
		ASSERT_EQUAL(padded.size(), 9u, "Padded length is 3N");
		ASSERT_TRUE(padded == expected, "reversed | row | reversed");
	}

	TEST_SECTION("FFT and inverse FFT");
	{
		ste::SurfaceProcessor processor;
		std::vector<double> impulse = {1.0, 0.0, 0.0, 0.0};
		std::vector<std::complex<double>> spectrum = processor.fft(impulse.data(), 4);
		bool flat = spectrum.size() == 4;
		for (const auto& bin : spectrum) {
			flat = flat && std::abs(bin - std::complex<double>(1.0, 0.0)) < TOLERANCE;
		}
		ASSERT_TRUE(flat, "Impulse transforms to a flat spectrum");

		std::vector<double> signal = {4.0, -1.0, 2.5, 0.5, 3.0, 7.0};
		std::vector<std::complex<double>> signalSpectrum = processor.fft(signal.data(), 6);
		ASSERT_NEAR(signalSpectrum[0].real(), 16.0, TOLERANCE, "DC bin is the sample sum");
		std::vector<double> restored = processor.ifft(signalSpectrum.data(), 6);
		ASSERT_NEAR(maxAbsDifference(restored, signal), 0.0, TOLERANCE, "Inverse transform is normalized");
	}

	TEST_SECTION("Wavelength table");
	{
		ste::SurfaceProcessor processor;
		processor.setSampleWidth(100.0);
		std::vector<double> table = processor.computeWavelengthTable(8);
		ASSERT_EQUAL(table.size(), 8u, "One wavelength per index 1..N");
		ASSERT_NEAR(table[0], 600.0, TOLERANCE, "j = 1 -> 2 * 3 * width");
		ASSERT_NEAR(table[2], 200.0, TOLERANCE, "j = 3 -> 200");
		ASSERT_NEAR(table[7], 75.0, TOLERANCE, "j = 8 -> 75");
	}

	TEST_SECTION("Stop index");
	{
		ste::SurfaceProcessor processor;
		processor.setSampleWidth(100.0);
		processor.setCutoffWavelength(80.0);
		ASSERT_EQUAL(processor.findStopIndex(8), 8, "Width 100, cutoff 80, N = 8 -> stop at 8");
		ASSERT_EQUAL(processor.findStopIndex(64), 8, "Stop index does not depend on N once reachable");

		processor.setCutoffWavelength(1000.0);
		ASSERT_EQUAL(processor.findStopIndex(8), 1, "Cutoff above the longest wavelength -> stop at 1");

		processor.setCutoffWavelength(200.0);
		ASSERT_EQUAL(processor.findStopIndex(4), 3, "Wavelength equal to cutoff stops");
	}

	TEST_SECTION("Stop index is non-increasing in the cutoff");
	{
		ste::SurfaceProcessor processor;
		processor.setSampleWidth(643.0);
		const double cutoffs[] = {80.0, 100.0, 150.0, 300.0, 1000.0, 5000.0};
		int previous = 1 << 30;
		bool monotonic = true;
		for (double cutoff : cutoffs) {
			processor.setCutoffWavelength(cutoff);
			int stop = processor.findStopIndex(128);
			monotonic = monotonic && stop <= previous;
			previous = stop;
		}
		ASSERT_TRUE(monotonic, "Longer cutoff keeps fewer bins in waviness");
		processor.setCutoffWavelength(80.0);
		ASSERT_EQUAL(processor.findStopIndex(128), 49, "Default width and cutoff -> stop at 49");
	}

	TEST_SECTION("Cutoff unreachable");
	{
		ste::SurfaceProcessor processor;
		processor.setSampleWidth(100.0);
		processor.setCutoffWavelength(100.0);
		ASSERT_THROWS(processor.findStopIndex(4), ste::CutoffUnreachableError,
			"N = 4, shortest wavelength 150 > cutoff 100");

		std::vector<double> row(4, 1.0);
		ASSERT_THROWS(processor.filterRow(row), ste::CutoffUnreachableError,
			"Filtering reports the error instead of returning a partial row");

		// Default width needs N >= 49 for the default cutoff
		ste::SurfaceProcessor defaults;
		ASSERT_THROWS(defaults.findStopIndex(48), ste::CutoffUnreachableError, "Defaults with N = 48");
		ASSERT_EQUAL(defaults.findStopIndex(49), 49, "Defaults with N = 49");
	}

	TEST_SECTION("Degenerate rows");
	{
		ste::SurfaceProcessor processor;
		processor.setSampleWidth(100.0);
		processor.setCutoffWavelength(1000.0);
		ASSERT_THROWS(processor.findStopIndex(1), ste::DegenerateRowError, "Single sample row");
		ASSERT_THROWS(processor.findStopIndex(0), ste::DegenerateRowError, "Empty row");
		ASSERT_THROWS(processor.filterRow(std::vector<double>(1, 3.0)), ste::DegenerateRowError,
			"Filtering a single sample row");
	}

	TEST_SECTION("Constant row passes unchanged");
	{
		ste::SurfaceProcessor processor;
		processor.setSampleWidth(100.0);
		processor.setCutoffWavelength(80.0);
		std::vector<double> row(8, 5.0);
		std::vector<double> waviness = processor.filterRow(row);
		ASSERT_NEAR(maxAbsDifference(waviness, row), 0.0, TOLERANCE, "Waviness equals the constant row");

		processor.setCutoffWavelength(1000.0);
		waviness = processor.filterRow(row);
		ASSERT_NEAR(maxAbsDifference(waviness, row), 0.0, TOLERANCE, "Also with stop index 1");
	}

	TEST_SECTION("FFTW filter matches direct DFT reference");
	{
		struct Case {
			size_t length;
			double sampleWidth;
			double cutoff;
		};
		const Case cases[] = {
			{16, 100.0, 80.0},    // stop 8
			{32, 100.0, 20.0},    // stop 30
			{24, 100.0, 1000.0},  // stop 1
			{64, 643.0, 80.0},    // stop 49
			{9, 10.0, 10.0}       // stop 6, odd length
		};

		unsigned int seed = 1;
		for (const Case& c : cases) {
			ste::SurfaceProcessor processor;
			processor.setSampleWidth(c.sampleWidth);
			processor.setCutoffWavelength(c.cutoff);

			std::vector<double> row = randomRow(c.length, seed++);
			std::vector<double> waviness = processor.filterRow(row);
			std::vector<double> expected = referenceWaviness(row, c.cutoff, c.sampleWidth);

			ASSERT_NEAR(maxAbsDifference(waviness, expected), 0.0, TOLERANCE,
				"N = " << c.length << ", width " << c.sampleWidth << ", cutoff " << c.cutoff);
		}
	}

	TEST_SECTION("Filter uses initialized workspace and temporary plans alike");
	{
		ste::SurfaceProcessor processor;
		processor.setSampleWidth(100.0);
		processor.setCutoffWavelength(80.0);
		std::vector<double> row = randomRow(16, 99);
		std::vector<double> uninitialized = processor.filterRow(row);
		processor.initialize(16);
		ASSERT_TRUE(processor.isInitialized(), "Processor initialized for N = 16");
		std::vector<double> initialized = processor.filterRow(row);
		ASSERT_NEAR(maxAbsDifference(initialized, uninitialized), 0.0, 1e-12, "Same waviness row");
		processor.cleanup();
		ASSERT_TRUE(!processor.isInitialized(), "Cleanup releases the workspaces");
	}

	std::cout << std::endl;
	std::cout << (allTestsPassed ? "ALL TESTS PASSED" : "SOME TESTS FAILED") << std::endl;
	return allTestsPassed ? 0 : 1;
}
