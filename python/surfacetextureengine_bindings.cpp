#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>
#include <pybind11/numpy.h>

#include <algorithm>

#include "surfaceprocessor.h"
#include "surfaceio.h"
#include "decompositionconfiguration.h"
#include "errors.h"
#include "types.h"
#include "version.h"

namespace py = pybind11;

// ============================================
// GRID <-> NUMPY CONVERSION
// ============================================

// Copy of the grid as an N x N float64 array
py::array_t<double> grid_to_numpy(const ste::ProfileGrid& grid) {
	const py::ssize_t n = grid.getDimension();
	py::array_t<double> array({n, n});
	if (n > 0) {
		std::copy(grid.getData().begin(), grid.getData().end(), array.mutable_data());
	}
	return array;
}

py::array_t<double> vector_to_numpy(const std::vector<double>& values) {
	return py::array_t<double>(static_cast<py::ssize_t>(values.size()), values.data());
}

// Accepts a flat sample sequence or an N x N height map
std::vector<double> numpy_to_samples(py::array_t<double, py::array::c_style | py::array::forcecast> array) {
	py::buffer_info buf = array.request();
	if (buf.ndim == 2 && buf.shape[0] != buf.shape[1]) {
		throw ste::InputShapeError("Height map must be square, got " +
			std::to_string(buf.shape[0]) + "x" + std::to_string(buf.shape[1]));
	}
	if (buf.ndim != 1 && buf.ndim != 2) {
		throw ste::InputShapeError("Expected a 1-D sample array or a 2-D height map");
	}
	const double* ptr = static_cast<const double*>(buf.ptr);
	return std::vector<double>(ptr, ptr + buf.size);
}

// ============================================
// PROCESSOR WRAPPER WITH CALLBACK SUPPORT
// ============================================

class SurfaceProcessorWrapper {
public:
	ste::SurfaceProcessor processor;
	py::function warning_callback;

	SurfaceProcessorWrapper() = default;
	explicit SurfaceProcessorWrapper(const ste::DecompositionConfiguration& config) : processor(config) {}

	void set_warning_callback(py::function cb) {
		warning_callback = cb;
		processor.setWarningCallback([this](const std::string& message) {
			// Re-acquire GIL to call Python code
			py::gil_scoped_acquire acquire;
			warning_callback(py::str(message));
		});
	}

	ste::SurfaceDecomposition decompose(py::array_t<double, py::array::c_style | py::array::forcecast> heights) {
		std::vector<double> samples = numpy_to_samples(heights);
		py::gil_scoped_release release;
		return processor.decomposeSamples(samples);
	}

	ste::SurfaceDecomposition decompose_file(const std::string& filepath) {
		py::gil_scoped_release release;
		return processor.decomposeFile(filepath);
	}

	py::array_t<double> filter_row(py::array_t<double, py::array::c_style | py::array::forcecast> row) {
		py::buffer_info buf = row.request();
		if (buf.ndim != 1) {
			throw ste::InputShapeError("filter_row expects a 1-D array");
		}
		const double* ptr = static_cast<const double*>(buf.ptr);
		ste::Row input(ptr, ptr + buf.size);
		ste::Row waviness;
		{
			py::gil_scoped_release release;
			waviness = processor.filterRow(input);
		}
		return vector_to_numpy(waviness);
	}

	void initialize(int row_length) {
		py::gil_scoped_release release;
		processor.initialize(row_length);
	}

	void stop() {
		py::gil_scoped_release release;
		processor.cleanup();
	}

	// Context manager support
	SurfaceProcessorWrapper& enter() {
		return *this;
	}

	void exit(py::object exc_type, py::object exc_value, py::object traceback) {
		stop();
	}
};

// ============================================
// PYBIND11 MODULE DEFINITION
// ============================================

PYBIND11_MODULE(surfacetextureengine, m) {
	m.doc() = "SurfaceTextureEngine - waviness and roughness decomposition of surface height maps";

	// ============================================
	// EXCEPTIONS
	// ============================================

	auto surfaceError = py::register_exception<ste::SurfaceError>(m, "SurfaceError");
	py::register_exception<ste::InputShapeError>(m, "InputShapeError", surfaceError.ptr());
	py::register_exception<ste::CutoffUnreachableError>(m, "CutoffUnreachableError", surfaceError.ptr());
	py::register_exception<ste::DegenerateRowError>(m, "DegenerateRowError", surfaceError.ptr());
	py::register_exception<ste::SurfaceIOError>(m, "SurfaceIOError", surfaceError.ptr());
	py::register_exception<ste::ConfigurationError>(m, "ConfigurationError", surfaceError.ptr());
	py::register_exception<ste::BackendError>(m, "BackendError", surfaceError.ptr());

	// ============================================
	// ENUMS
	// ============================================

	py::enum_<ste::MetricType>(m, "MetricType")
		.value("WA", ste::MetricType::WA, "Mean absolute waviness per row")
		.value("RA", ste::MetricType::RA, "Mean absolute roughness per row")
		.export_values();

	// ============================================
	// CONFIGURATION STRUCTS
	// ============================================

	py::class_<ste::DecompositionConfiguration::FilterParameters>(m, "FilterParameters")
		.def(py::init<>())
		.def_readwrite("cutoff_wavelength", &ste::DecompositionConfiguration::FilterParameters::cutoffWavelength)
		.def_readwrite("sample_width", &ste::DecompositionConfiguration::FilterParameters::sampleWidth);

	py::class_<ste::DecompositionConfiguration::InputParameters>(m, "InputParameters")
		.def(py::init<>())
		.def_property("delimiter",
			[](const ste::DecompositionConfiguration::InputParameters& self) {
				return std::string(1, self.delimiter);
			},
			[](ste::DecompositionConfiguration::InputParameters& self, const std::string& delimiter) {
				if (delimiter.size() != 1) throw ste::ConfigurationError("Delimiter must be a single character");
				self.delimiter = delimiter[0];
			})
		.def_readwrite("strict_shape", &ste::DecompositionConfiguration::InputParameters::strictShape);

	py::class_<ste::DecompositionConfiguration::ProcessingParameters>(m, "ProcessingParameters")
		.def(py::init<>())
		.def_readwrite("threads", &ste::DecompositionConfiguration::ProcessingParameters::threads)
		.def("get_effective_thread_count", &ste::DecompositionConfiguration::ProcessingParameters::getEffectiveThreadCount);

	// ============================================
	// CONFIGURATION CLASS
	// ============================================

	py::class_<ste::DecompositionConfiguration>(m, "DecompositionConfiguration")
		.def(py::init<>())
		.def_readwrite("filter", &ste::DecompositionConfiguration::filterParams)
		.def_readwrite("input", &ste::DecompositionConfiguration::inputParams)
		.def_readwrite("processing", &ste::DecompositionConfiguration::processingParams)
		.def("save_to_file", &ste::DecompositionConfiguration::saveToFile)
		.def("load_from_file", &ste::DecompositionConfiguration::loadFromFile)
		.def("validate", &ste::DecompositionConfiguration::validate);

	// ============================================
	// RESULTS
	// ============================================

	py::class_<ste::SectionProfile>(m, "SectionProfile")
		.def_readonly("row_index", &ste::SectionProfile::rowIndex)
		.def_property_readonly("position", [](const ste::SectionProfile& self) { return vector_to_numpy(self.position); })
		.def_property_readonly("primary", [](const ste::SectionProfile& self) { return vector_to_numpy(self.primary); })
		.def_property_readonly("waviness", [](const ste::SectionProfile& self) { return vector_to_numpy(self.waviness); })
		.def_property_readonly("roughness", [](const ste::SectionProfile& self) { return vector_to_numpy(self.roughness); })
		.def("save_csv", [](const ste::SectionProfile& self, const std::string& filepath) {
			ste::writeSectionCsv(filepath, self);
		}, py::arg("filepath"), "Write x, primary, waviness and roughness columns");

	py::class_<ste::SurfaceDecomposition>(m, "SurfaceDecomposition")
		.def_property_readonly("primary", [](const ste::SurfaceDecomposition& self) { return grid_to_numpy(self.getPrimary()); })
		.def_property_readonly("waviness", [](const ste::SurfaceDecomposition& self) { return grid_to_numpy(self.getWaviness()); })
		.def_property_readonly("roughness", [](const ste::SurfaceDecomposition& self) { return grid_to_numpy(self.getRoughness()); })
		.def_property_readonly("wa", [](const ste::SurfaceDecomposition& self) {
			return vector_to_numpy(self.getMetric(ste::MetricType::WA));
		})
		.def_property_readonly("ra", [](const ste::SurfaceDecomposition& self) {
			return vector_to_numpy(self.getMetric(ste::MetricType::RA));
		})
		.def_property_readonly("dimension", &ste::SurfaceDecomposition::getDimension)
		.def_property_readonly("cutoff_wavelength", &ste::SurfaceDecomposition::getCutoffWavelength)
		.def_property_readonly("sample_width", &ste::SurfaceDecomposition::getSampleWidth)
		.def_property_readonly("stop_index", &ste::SurfaceDecomposition::getStopIndex)
		.def("get_metric", [](const ste::SurfaceDecomposition& self, ste::MetricType type) {
			return vector_to_numpy(self.getMetric(type));
		}, py::arg("metric"))
		.def("get_centered_metric", [](const ste::SurfaceDecomposition& self, ste::MetricType type) {
			return vector_to_numpy(self.getCenteredMetric(type));
		}, py::arg("metric"), "Metric series with its mean subtracted")
		.def("get_positions", [](const ste::SurfaceDecomposition& self) {
			return vector_to_numpy(self.getPositions());
		}, "Row positions from 0 to the sample width")
		.def("get_section", &ste::SurfaceDecomposition::getSection, py::arg("row"))
		.def("save_metrics_csv", [](const ste::SurfaceDecomposition& self, const std::string& filepath) {
			ste::writeMetricsCsv(filepath, self);
		}, py::arg("filepath"))
		.def("__repr__", [](const ste::SurfaceDecomposition& self) {
			return "<SurfaceDecomposition(dimension=" + std::to_string(self.getDimension()) +
				", stop_index=" + std::to_string(self.getStopIndex()) + ")>";
		});

	// ============================================
	// PROCESSOR CLASS
	// ============================================

	py::class_<SurfaceProcessorWrapper>(m, "SurfaceProcessor")
		.def(py::init<>(), "Create a processor with default parameters")
		.def(py::init<const ste::DecompositionConfiguration&>(), py::arg("config"),
			"Create a processor from a configuration")

		// Lifecycle
		.def("initialize", &SurfaceProcessorWrapper::initialize, py::arg("row_length"),
			"Prepare FFT plans for rows of the given length.\n"
			"Optional, decompose() initializes on demand.")
		.def("stop", &SurfaceProcessorWrapper::stop,
			"Free FFT plans and buffers.")

		// Configuration
		.def("load_config", [](SurfaceProcessorWrapper& self, const std::string& filepath) {
			self.processor.loadConfigurationFromFile(filepath);
		}, py::arg("filepath"),
			"Load configuration from INI file\n\n"
			"Args:\n"
			"    filepath: Path to configuration file")
		.def("save_config", [](const SurfaceProcessorWrapper& self, const std::string& filepath) {
			self.processor.saveConfigurationToFile(filepath);
		}, py::arg("filepath"),
			"Save current configuration to INI file\n\n"
			"Args:\n"
			"    filepath: Path to save configuration")
		.def_property_readonly("config",
			[](const SurfaceProcessorWrapper& self) {
				return self.processor.getConfig();
			},
			"Copy of the current configuration")
		.def("set_config", [](SurfaceProcessorWrapper& self, const ste::DecompositionConfiguration& config) {
			self.processor.setConfig(config);
		}, py::arg("config"), "Set entire configuration at once")
		.def("set_cutoff_wavelength", [](SurfaceProcessorWrapper& self, double cutoff) {
			self.processor.setCutoffWavelength(cutoff);
		}, py::arg("cutoff"))
		.def("set_sample_width", [](SurfaceProcessorWrapper& self, double width) {
			self.processor.setSampleWidth(width);
		}, py::arg("width"))
		.def("set_thread_count", [](SurfaceProcessorWrapper& self, int threads) {
			self.processor.setThreadCount(threads);
		}, py::arg("threads"), "Row-parallel workers, 0 = hardware concurrency")
		.def("set_strict_shape", [](SurfaceProcessorWrapper& self, bool strict) {
			self.processor.setStrictShape(strict);
		}, py::arg("strict"))
		.def("set_delimiter", [](SurfaceProcessorWrapper& self, const std::string& delimiter) {
			if (delimiter.size() != 1) throw ste::ConfigurationError("Delimiter must be a single character");
			self.processor.setDelimiter(delimiter[0]);
		}, py::arg("delimiter"), "Separator of the height export read by decompose_file")
		.def("compute_waviness", [](SurfaceProcessorWrapper& self,
				py::array_t<double, py::array::c_style | py::array::forcecast> heights) {
			ste::ProfileGrid grid = self.processor.createProfileGrid(numpy_to_samples(heights));
			ste::WavinessGrid waviness;
			{
				py::gil_scoped_release release;
				waviness = self.processor.computeWaviness(grid);
			}
			return grid_to_numpy(waviness);
		}, py::arg("heights"), "Waviness grid only, without roughness or metrics")
		.def("set_warning_callback", &SurfaceProcessorWrapper::set_warning_callback, py::arg("callback"),
			"Set function receiving warning messages, e.g. for truncated input")

		// Processing
		.def("decompose", &SurfaceProcessorWrapper::decompose, py::arg("heights"),
			"Split a height map into waviness and roughness\n\n"
			"Args:\n"
			"    heights: Flat sample array or square 2-D height map\n\n"
			"Returns:\n"
			"    SurfaceDecomposition")
		.def("decompose_file", &SurfaceProcessorWrapper::decompose_file, py::arg("filepath"),
			"Read a delimited height export and decompose it")
		.def("filter_row", &SurfaceProcessorWrapper::filter_row, py::arg("row"),
			"Waviness of a single row")
		.def("find_stop_index", [](const SurfaceProcessorWrapper& self, int row_length) {
			return self.processor.findStopIndex(row_length);
		}, py::arg("row_length"))
		.def("compute_wavelength_table", [](const SurfaceProcessorWrapper& self, int row_length) {
			return vector_to_numpy(self.processor.computeWavelengthTable(row_length));
		}, py::arg("row_length"))

		// Context manager support
		.def("__enter__", &SurfaceProcessorWrapper::enter, py::return_value_policy::reference)
		.def("__exit__", &SurfaceProcessorWrapper::exit)

		.def("__repr__", [](const SurfaceProcessorWrapper& self) {
			const ste::DecompositionConfiguration& config = self.processor.getConfig();
			return "<SurfaceProcessor(cutoff=" + std::to_string(config.filterParams.cutoffWavelength) +
				", sample_width=" + std::to_string(config.filterParams.sampleWidth) + ")>";
		});

	// ============================================
	// FILE HELPERS
	// ============================================

	m.def("read_surface_samples", [](const std::string& filepath, const std::string& delimiter) {
		if (delimiter.size() != 1) throw ste::ConfigurationError("Delimiter must be a single character");
		return vector_to_numpy(ste::readSurfaceSamples(filepath, delimiter[0]));
	}, py::arg("filepath"), py::arg("delimiter") = ",");

	// ============================================
	// MODULE VERSION
	// ============================================

	m.attr("__version__") = STE_VERSION_STRING;
}
