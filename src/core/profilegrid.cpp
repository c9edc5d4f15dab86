#include "../../include/profilegrid.h"
#include "../../include/errors.h"
#include <cmath>
#include <stdexcept>
#include <string>

namespace ste {

ProfileGrid::ProfileGrid()
	: dimension(0)
	, discardedSamples(0)
{
}

ProfileGrid::ProfileGrid(int dimension, std::vector<double> values)
	: dimension(dimension)
	, data(std::move(values))
	, discardedSamples(0)
{
	if (dimension < 0) {
		throw std::invalid_argument("Grid dimension must not be negative");
	}
	if (this->data.size() != static_cast<size_t>(dimension) * static_cast<size_t>(dimension)) {
		throw std::invalid_argument("Grid of dimension " + std::to_string(dimension) +
			" needs " + std::to_string(static_cast<size_t>(dimension) * dimension) +
			" samples, got " + std::to_string(this->data.size()));
	}
}

ProfileGrid ProfileGrid::fromSamples(const std::vector<double>& samples, bool strictShape) {
	const int n = dimensionForSampleCount(samples.size());
	const size_t used = static_cast<size_t>(n) * static_cast<size_t>(n);
	const size_t discarded = samples.size() - used;

	if (discarded > 0 && strictShape) {
		throw InputShapeError("Sample count " + std::to_string(samples.size()) +
			" is not a perfect square (nearest grid is " + std::to_string(n) + "x" + std::to_string(n) + ")");
	}

	ProfileGrid grid(n, std::vector<double>(samples.begin(), samples.begin() + used));
	grid.discardedSamples = discarded;
	return grid;
}

int ProfileGrid::dimensionForSampleCount(size_t sampleCount) {
	// Correct floating point rounding of sqrt for large counts
	size_t n = static_cast<size_t>(std::sqrt(static_cast<double>(sampleCount)));
	while (n > 0 && n * n > sampleCount) {
		--n;
	}
	while ((n + 1) * (n + 1) <= sampleCount) {
		++n;
	}
	return static_cast<int>(n);
}

int ProfileGrid::getDimension() const {
	return this->dimension;
}

size_t ProfileGrid::getSampleCount() const {
	return this->data.size();
}

size_t ProfileGrid::getDiscardedSampleCount() const {
	return this->discardedSamples;
}

bool ProfileGrid::isEmpty() const {
	return this->data.empty();
}

double ProfileGrid::at(int row, int col) const {
	this->checkRowIndex(row);
	if (col < 0 || col >= this->dimension) {
		throw std::out_of_range("Column index " + std::to_string(col) + " out of range");
	}
	return this->data[static_cast<size_t>(row) * this->dimension + col];
}

const double* ProfileGrid::getRowPointer(int row) const {
	this->checkRowIndex(row);
	return this->data.data() + static_cast<size_t>(row) * this->dimension;
}

Row ProfileGrid::getRow(int row) const {
	const double* start = this->getRowPointer(row);
	return Row(start, start + this->dimension);
}

const std::vector<double>& ProfileGrid::getData() const {
	return this->data;
}

void ProfileGrid::checkRowIndex(int row) const {
	if (row < 0 || row >= this->dimension) {
		throw std::out_of_range("Row index " + std::to_string(row) + " out of range for grid of dimension " + std::to_string(this->dimension));
	}
}

} // namespace ste
