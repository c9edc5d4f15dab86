#ifndef STE_PROFILEGRID_H
#define STE_PROFILEGRID_H

#include <cstddef>
#include <vector>
#include "types.h"
#include "export.h"

namespace ste {

// Square N x N matrix of height samples, stored row-major.
// Used for the primary profile as well as the derived waviness and
// roughness grids. Immutable after construction.
class STE_API ProfileGrid {
public:
	ProfileGrid();

	// values.size() must equal dimension * dimension
	ProfileGrid(int dimension, std::vector<double> values);

	// Reshape a flat sample sequence into the largest square grid it fills.
	// Trailing samples that do not fit are discarded and counted; with
	// strictShape the non-square count throws InputShapeError instead.
	static ProfileGrid fromSamples(const std::vector<double>& samples, bool strictShape = false);

	// Integer square root of the sample count
	static int dimensionForSampleCount(size_t sampleCount);

	int getDimension() const;
	size_t getSampleCount() const;
	size_t getDiscardedSampleCount() const;
	bool isEmpty() const;

	double at(int row, int col) const;
	const double* getRowPointer(int row) const;
	Row getRow(int row) const;
	const std::vector<double>& getData() const;

private:
	int dimension;
	std::vector<double> data;
	size_t discardedSamples;

	void checkRowIndex(int row) const;
};

using WavinessGrid = ProfileGrid;
using RoughnessGrid = ProfileGrid;

} // namespace ste

#endif // STE_PROFILEGRID_H
