#include "../../include/surfaceio.h"
#include "../../include/errors.h"
#include "../../include/types.h"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace ste {

namespace {

std::string trim(const std::string& s) {
	size_t i = 0;
	while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
	size_t j = s.size();
	while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
	return s.substr(i, j - i);
}

std::ofstream openForWriting(const std::string& filepath) {
	std::ofstream out(filepath);
	if (!out) {
		throw SurfaceIOError("Cannot open file for writing: " + filepath);
	}
	out << std::setprecision(std::numeric_limits<double>::max_digits10);
	return out;
}

void finishWriting(std::ofstream& out, const std::string& filepath) {
	out.flush();
	if (!out) {
		throw SurfaceIOError("Failed to write file: " + filepath);
	}
}

} // namespace

std::vector<double> parseSurfaceSamples(const std::string& text, char delimiter) {
	std::vector<double> samples;
	size_t tokenIndex = 0;
	size_t start = 0;

	while (start <= text.size()) {
		size_t end = start;
		while (end < text.size() && text[end] != delimiter && text[end] != '\n' && text[end] != '\r') {
			++end;
		}

		std::string token = trim(text.substr(start, end - start));
		if (!token.empty()) {
			char* parsedEnd = nullptr;
			double value = std::strtod(token.c_str(), &parsedEnd);
			if (parsedEnd == token.c_str() || *parsedEnd != '\0') {
				throw SurfaceIOError("Invalid sample '" + token + "' at entry " + std::to_string(tokenIndex));
			}
			samples.push_back(value);
		}

		++tokenIndex;
		start = end + 1;
	}

	return samples;
}

std::vector<double> readSurfaceSamples(const std::string& filepath, char delimiter) {
	std::ifstream in(filepath, std::ios::binary);
	if (!in) {
		throw SurfaceIOError("Cannot open surface file: " + filepath);
	}

	std::ostringstream content;
	content << in.rdbuf();
	if (in.bad()) {
		throw SurfaceIOError("Failed to read surface file: " + filepath);
	}

	return parseSurfaceSamples(content.str(), delimiter);
}

void writeGridCsv(const std::string& filepath, const ProfileGrid& grid, char delimiter) {
	std::ofstream out = openForWriting(filepath);
	const int n = grid.getDimension();
	for (int row = 0; row < n; ++row) {
		const double* values = grid.getRowPointer(row);
		for (int col = 0; col < n; ++col) {
			if (col > 0) {
				out << delimiter;
			}
			out << values[col];
		}
		out << "\n";
	}
	finishWriting(out, filepath);
}

void writeMetricsCsv(const std::string& filepath, const SurfaceDecomposition& decomposition) {
	const std::vector<double>& wa = decomposition.getMetric(MetricType::WA);
	const std::vector<double>& ra = decomposition.getMetric(MetricType::RA);
	const std::vector<double> positions = decomposition.getPositions();

	std::ofstream out = openForWriting(filepath);
	out << "row,x," << getMetricName(MetricType::WA) << "," << getMetricName(MetricType::RA) << "\n";
	for (size_t i = 0; i < wa.size(); ++i) {
		out << i << "," << positions[i] << "," << wa[i] << "," << ra[i] << "\n";
	}
	finishWriting(out, filepath);
}

void writeSectionCsv(const std::string& filepath, const SectionProfile& section) {
	std::ofstream out = openForWriting(filepath);
	out << "x,primary,waviness,roughness\n";
	for (size_t i = 0; i < section.position.size(); ++i) {
		out << section.position[i] << ","
			<< section.primary[i] << ","
			<< section.waviness[i] << ","
			<< section.roughness[i] << "\n";
	}
	finishWriting(out, filepath);
}

} // namespace ste
