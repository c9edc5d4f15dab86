#ifndef STE_ERRORS_H
#define STE_ERRORS_H

#include <stdexcept>
#include <string>
#include "export.h"

namespace ste {

// Base class of all errors reported by the decomposition pipeline
class STE_API SurfaceError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

// Sample count is not a perfect square (only raised in strict shape mode)
class STE_API InputShapeError : public SurfaceError {
public:
	using SurfaceError::SurfaceError;
};

// No frequency index within the row length reaches the cutoff wavelength
class STE_API CutoffUnreachableError : public SurfaceError {
public:
	using SurfaceError::SurfaceError;
};

// Row has fewer than 2 samples
class STE_API DegenerateRowError : public SurfaceError {
public:
	using SurfaceError::SurfaceError;
};

// Surface or result file could not be read, parsed or written
class STE_API SurfaceIOError : public SurfaceError {
public:
	using SurfaceError::SurfaceError;
};

class STE_API ConfigurationError : public SurfaceError {
public:
	using SurfaceError::SurfaceError;
};

// FFTW allocation/planning failures and backend misuse
class STE_API BackendError : public SurfaceError {
public:
	using SurfaceError::SurfaceError;
};

} // namespace ste

#endif // STE_ERRORS_H
