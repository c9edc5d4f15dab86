#ifndef STE_SURFACEIO_H
#define STE_SURFACEIO_H

#include <string>
#include <vector>
#include "profilegrid.h"
#include "surfacedecomposition.h"
#include "export.h"

namespace ste {

// Split text on the delimiter and on line breaks. Empty entries are
// skipped, a token that is not a number throws SurfaceIOError.
STE_API std::vector<double> parseSurfaceSamples(const std::string& text, char delimiter = ',');

// Read a LEXT height export (all samples usually on a single line)
STE_API std::vector<double> readSurfaceSamples(const std::string& filepath, char delimiter = ',');

// One grid row per line
STE_API void writeGridCsv(const std::string& filepath, const ProfileGrid& grid, char delimiter = ',');

// Columns: row,x,Wa,Ra
STE_API void writeMetricsCsv(const std::string& filepath, const SurfaceDecomposition& decomposition);

// Columns: x,primary,waviness,roughness
STE_API void writeSectionCsv(const std::string& filepath, const SectionProfile& section);

} // namespace ste

#endif // STE_SURFACEIO_H
