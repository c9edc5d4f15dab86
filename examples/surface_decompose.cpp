// Decompose a LEXT height export into waviness and roughness

#include "surfaceprocessor.h"
#include "surfaceio.h"
#include "version.h"
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace {

void printUsage() {
	std::cout << "surface_decompose " << STE_VERSION_STRING << "\n"
	          << "Usage:\n"
	          << "  surface_decompose --input <surface.csv> [options]\n"
	          << "Options:\n"
	          << "  --config <file.ini>   load configuration\n"
	          << "  --cutoff <length>     cutoff wavelength (default 80)\n"
	          << "  --width <length>      sample width (default 643)\n"
	          << "  --threads <n>         row-parallel workers, 0 = all cores (default 1)\n"
	          << "  --strict              reject sample counts that are not a perfect square\n"
	          << "  --section <row>       also write the cross section of this row\n"
	          << "  --output <dir>        output directory (default: current directory)\n";
}

double parseNumber(const std::string& option, const std::string& value) {
	char* end = nullptr;
	double out = std::strtod(value.c_str(), &end);
	if (value.empty() || *end != '\0') {
		throw std::invalid_argument("Invalid value for " + option + ": " + value);
	}
	return out;
}

int parseInteger(const std::string& option, const std::string& value) {
	char* end = nullptr;
	errno = 0;
	long out = std::strtol(value.c_str(), &end, 10);
	if (value.empty() || *end != '\0' || errno == ERANGE ||
		out < std::numeric_limits<int>::min() || out > std::numeric_limits<int>::max()) {
		throw std::invalid_argument("Invalid integer for " + option + ": " + value);
	}
	return static_cast<int>(out);
}

} // namespace

int main(int argc, char** argv) {
	try {
		std::string inputPath;
		std::string configPath;
		std::string outputDir = ".";
		int sectionRow = -1;
		ste::SurfaceProcessor processor;

		// Config file first so command line values override it
		for (int i = 1; i + 1 < argc; ++i) {
			if (std::string(argv[i]) == "--config") {
				configPath = argv[i + 1];
				processor.loadConfigurationFromFile(configPath);
			}
		}

		for (int i = 1; i < argc; ++i) {
			std::string a = argv[i];
			bool hasValue = i + 1 < argc;
			if (a == "--input" && hasValue) {
				inputPath = argv[++i];
			} else if (a == "--config" && hasValue) {
				++i;
			} else if (a == "--cutoff" && hasValue) {
				processor.setCutoffWavelength(parseNumber(a, argv[++i]));
			} else if (a == "--width" && hasValue) {
				processor.setSampleWidth(parseNumber(a, argv[++i]));
			} else if (a == "--threads" && hasValue) {
				processor.setThreadCount(parseInteger(a, argv[++i]));
			} else if (a == "--section" && hasValue) {
				sectionRow = parseInteger(a, argv[++i]);
			} else if (a == "--output" && hasValue) {
				outputDir = argv[++i];
			} else if (a == "--strict") {
				processor.setStrictShape(true);
			} else if (a == "-h" || a == "--help") {
				printUsage();
				return 0;
			} else {
				std::cerr << "Unknown argument: " << a << "\n";
				printUsage();
				return 2;
			}
		}
		if (inputPath.empty()) {
			printUsage();
			return 2;
		}

		processor.setWarningCallback([](const std::string& message) {
			std::cerr << "WARNING: " << message << "\n";
		});

		ste::SurfaceDecomposition result = processor.decomposeFile(inputPath);

		const std::vector<double>& wa = result.getMetric(ste::MetricType::WA);
		const std::vector<double>& ra = result.getMetric(ste::MetricType::RA);
		double waMean = 0.0;
		double raMean = 0.0;
		for (size_t i = 0; i < wa.size(); ++i) {
			waMean += wa[i];
			raMean += ra[i];
		}
		waMean /= static_cast<double>(wa.size());
		raMean /= static_cast<double>(ra.size());

		std::cout << "Grid: " << result.getDimension() << "x" << result.getDimension() << "\n";
		std::cout << "Cutoff: " << result.getCutoffWavelength()
		          << ", sample width: " << result.getSampleWidth()
		          << ", stop index: " << result.getStopIndex() << "\n";
		std::cout << "Mean Wa: " << waMean << "\n";
		std::cout << "Mean Ra: " << raMean << "\n";

		std::filesystem::path out(outputDir);
		std::filesystem::create_directories(out);
		ste::writeGridCsv((out / "waviness.csv").string(), result.getWaviness());
		ste::writeGridCsv((out / "roughness.csv").string(), result.getRoughness());
		ste::writeMetricsCsv((out / "metrics.csv").string(), result);
		if (sectionRow >= 0) {
			ste::writeSectionCsv((out / "section.csv").string(), result.getSection(sectionRow));
		}

		std::cout << "Done. Output in: " << out.string() << "\n";
		return 0;
	} catch (const std::exception& e) {
		std::cerr << "ERROR: " << e.what() << "\n";
		return 1;
	}
}
