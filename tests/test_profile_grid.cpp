#include "../include/profilegrid.h"
#include "../include/errors.h"
#include "../include/types.h"
#include <iostream>
#include <stdexcept>
#include <vector>

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

std::vector<double> sequence(size_t count) {
	std::vector<double> values(count);
	for (size_t i = 0; i < count; ++i) {
		values[i] = static_cast<double>(i);
	}
	return values;
}

int main() {
	std::cout << "Testing ProfileGrid..." << std::endl;

	TEST_SECTION("Dimension from sample count");
	ASSERT_EQUAL(ste::ProfileGrid::dimensionForSampleCount(0), 0, "0 samples -> N = 0");
	ASSERT_EQUAL(ste::ProfileGrid::dimensionForSampleCount(1), 1, "1 sample -> N = 1");
	ASSERT_EQUAL(ste::ProfileGrid::dimensionForSampleCount(15), 3, "15 samples -> N = 3");
	ASSERT_EQUAL(ste::ProfileGrid::dimensionForSampleCount(16), 4, "16 samples -> N = 4");
	ASSERT_EQUAL(ste::ProfileGrid::dimensionForSampleCount(17), 4, "17 samples -> N = 4");
	ASSERT_EQUAL(ste::ProfileGrid::dimensionForSampleCount(1024 * 1024), 1024, "1024^2 samples -> N = 1024");
	ASSERT_EQUAL(ste::ProfileGrid::dimensionForSampleCount(1024 * 1024 - 1), 1023, "1024^2 - 1 samples -> N = 1023");

	TEST_SECTION("Row-major reshape of a perfect square");
	{
		ste::ProfileGrid grid = ste::ProfileGrid::fromSamples(sequence(16));
		ASSERT_EQUAL(grid.getDimension(), 4, "Dimension is 4");
		ASSERT_EQUAL(grid.getSampleCount(), 16u, "All 16 samples used");
		ASSERT_EQUAL(grid.getDiscardedSampleCount(), 0u, "Nothing discarded");
		ASSERT_EQUAL(grid.at(0, 0), 0.0, "First sample at (0, 0)");
		ASSERT_EQUAL(grid.at(1, 0), 4.0, "Row 1 starts at sample 4");
		ASSERT_EQUAL(grid.at(3, 3), 15.0, "Last sample at (3, 3)");

		ste::Row row = grid.getRow(2);
		ASSERT_EQUAL(row.size(), 4u, "Row has N samples");
		ASSERT_EQUAL(row[0], 8.0, "Row 2 first sample");
		ASSERT_EQUAL(row[3], 11.0, "Row 2 last sample");
		ASSERT_EQUAL(grid.getRowPointer(3)[1], 13.0, "Row pointer addresses row 3");
	}

	TEST_SECTION("Non-square sample count");
	{
		ste::ProfileGrid grid = ste::ProfileGrid::fromSamples(sequence(20));
		ASSERT_EQUAL(grid.getDimension(), 4, "Truncated to 4x4");
		ASSERT_EQUAL(grid.getDiscardedSampleCount(), 4u, "4 trailing samples discarded");
		ASSERT_EQUAL(grid.at(3, 3), 15.0, "Kept samples are the leading ones");

		ASSERT_THROWS(ste::ProfileGrid::fromSamples(sequence(20), true), ste::InputShapeError,
			"Strict shape rejects 20 samples");
		ASSERT_THROWS(ste::ProfileGrid::fromSamples(sequence(20), true), ste::SurfaceError,
			"InputShapeError is a SurfaceError");

		ste::ProfileGrid strictGrid = ste::ProfileGrid::fromSamples(sequence(25), true);
		ASSERT_EQUAL(strictGrid.getDimension(), 5, "Strict shape accepts 25 samples");
	}

	TEST_SECTION("Empty input");
	{
		ste::ProfileGrid grid = ste::ProfileGrid::fromSamples(std::vector<double>());
		ASSERT_TRUE(grid.isEmpty(), "Grid from no samples is empty");
		ASSERT_EQUAL(grid.getDimension(), 0, "Dimension is 0");

		ste::ProfileGrid defaultGrid;
		ASSERT_TRUE(defaultGrid.isEmpty(), "Default grid is empty");
	}

	TEST_SECTION("Bounds and construction checks");
	{
		ste::ProfileGrid grid = ste::ProfileGrid::fromSamples(sequence(9));
		ASSERT_THROWS(grid.at(3, 0), std::out_of_range, "Row index 3 out of range");
		ASSERT_THROWS(grid.at(0, -1), std::out_of_range, "Negative column out of range");
		ASSERT_THROWS(grid.getRow(-1), std::out_of_range, "Negative row out of range");
		ASSERT_THROWS(ste::ProfileGrid(3, sequence(8)), std::invalid_argument, "Size mismatch rejected");
	}

	TEST_SECTION("Metric names");
	{
		ASSERT_EQUAL(ste::getMetricName(ste::MetricType::WA), std::string("Wa"), "WA -> Wa");
		ASSERT_EQUAL(ste::getMetricName(ste::MetricType::RA), std::string("Ra"), "RA -> Ra");
		ASSERT_TRUE(ste::parseMetricName("Ra") == ste::MetricType::RA, "Ra parses");
		ASSERT_TRUE(ste::parseMetricName("wa") == ste::MetricType::WA, "Lower case wa parses");
		ASSERT_THROWS(ste::parseMetricName("Rq"), std::invalid_argument, "Rq is not supported");
	}

	std::cout << std::endl;
	std::cout << (allTestsPassed ? "ALL TESTS PASSED" : "SOME TESTS FAILED") << std::endl;
	return allTestsPassed ? 0 : 1;
}
