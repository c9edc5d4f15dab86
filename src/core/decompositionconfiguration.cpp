#include "../../include/decompositionconfiguration.h"
#include "../../include/errors.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <map>
#include <sstream>
#include <thread>

namespace ste {

namespace {

using IniSection = std::map<std::string, std::string>;
using IniMap = std::map<std::string, IniSection>;

std::string trim(const std::string& s) {
	size_t i = 0;
	while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
	size_t j = s.size();
	while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
	return s.substr(i, j - i);
}

std::string toLower(std::string s) {
	std::transform(s.begin(), s.end(), s.begin(),
		[](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return s;
}

double parseDouble(const std::string& key, const std::string& value) {
	char* end = nullptr;
	double out = std::strtod(value.c_str(), &end);
	if (value.empty() || end == value.c_str() || *end != '\0') {
		throw ConfigurationError("Invalid number for '" + key + "': '" + value + "'");
	}
	return out;
}

int parseInt(const std::string& key, const std::string& value) {
	char* end = nullptr;
	long out = std::strtol(value.c_str(), &end, 10);
	if (value.empty() || end == value.c_str() || *end != '\0' ||
		out < std::numeric_limits<int>::min() || out > std::numeric_limits<int>::max()) {
		throw ConfigurationError("Invalid integer for '" + key + "': '" + value + "'");
	}
	return static_cast<int>(out);
}

bool parseBool(const std::string& key, const std::string& value) {
	std::string x = toLower(value);
	if (x == "1" || x == "true" || x == "yes" || x == "on") return true;
	if (x == "0" || x == "false" || x == "no" || x == "off") return false;
	throw ConfigurationError("Invalid boolean for '" + key + "': '" + value + "'");
}

// ';' and '#' start comments, so common delimiters are stored by name
std::string delimiterToString(char delimiter) {
	switch (delimiter) {
	case ',': return "comma";
	case ';': return "semicolon";
	case '\t': return "tab";
	case ' ': return "space";
	case '#': return "hash";
	default: return std::string(1, delimiter);
	}
}

char parseDelimiter(const std::string& value) {
	std::string x = toLower(value);
	if (x == "comma") return ',';
	if (x == "semicolon") return ';';
	if (x == "tab") return '\t';
	if (x == "space") return ' ';
	if (x == "hash") return '#';
	if (value.size() == 1) return value[0];
	throw ConfigurationError("Invalid delimiter: '" + value + "'");
}

IniMap parseIni(std::istream& in) {
	IniMap ini;
	std::string current;
	std::string line;
	size_t lineno = 0;

	while (std::getline(in, line)) {
		++lineno;

		size_t cut = line.find_first_of("#;");
		if (cut != std::string::npos) {
			line = line.substr(0, cut);
		}
		line = trim(line);
		if (line.empty()) continue;

		if (line.front() == '[' && line.back() == ']') {
			current = toLower(trim(line.substr(1, line.size() - 2)));
			if (current.empty()) {
				throw ConfigurationError("INI parse error: empty section at line " + std::to_string(lineno));
			}
			ini[current];
			continue;
		}

		size_t eq = line.find('=');
		if (eq == std::string::npos) {
			throw ConfigurationError("INI parse error: expected key=value at line " + std::to_string(lineno));
		}
		if (current.empty()) {
			throw ConfigurationError("INI parse error: key outside of a section at line " + std::to_string(lineno));
		}
		std::string key = toLower(trim(line.substr(0, eq)));
		if (key.empty()) {
			throw ConfigurationError("INI parse error: empty key at line " + std::to_string(lineno));
		}
		ini[current][key] = trim(line.substr(eq + 1));
	}
	return ini;
}

} // namespace

int DecompositionConfiguration::ProcessingParameters::getEffectiveThreadCount() const {
	if (this->threads > 0) {
		return this->threads;
	}
	unsigned int hw = std::thread::hardware_concurrency();
	return hw > 0 ? static_cast<int>(hw) : 1;
}

DecompositionConfiguration::DecompositionConfiguration() = default;

// ============================================
// File I/O
// ============================================

bool DecompositionConfiguration::saveToFile(const std::string& filepath) const {
	std::ofstream out(filepath);
	if (!out) {
		return false;
	}

	out << std::setprecision(std::numeric_limits<double>::max_digits10);
	out << "[filter]\n";
	out << "cutoff = " << this->filterParams.cutoffWavelength << "\n";
	out << "sample_width = " << this->filterParams.sampleWidth << "\n";
	out << "\n[input]\n";
	out << "delimiter = " << delimiterToString(this->inputParams.delimiter) << "\n";
	out << "strict_shape = " << (this->inputParams.strictShape ? "true" : "false") << "\n";
	out << "\n[processing]\n";
	out << "threads = " << this->processingParams.threads << "\n";

	return static_cast<bool>(out);
}

bool DecompositionConfiguration::loadFromFile(const std::string& filepath) {
	std::ifstream in(filepath);
	if (!in) {
		return false;
	}

	IniMap ini = parseIni(in);

	// Parse into a copy so a bad file leaves this configuration untouched
	DecompositionConfiguration loaded(*this);
	for (const auto& section : ini) {
		for (const auto& entry : section.second) {
			const std::string& key = entry.first;
			const std::string& value = entry.second;
			const std::string qualified = section.first + "." + key;

			if (section.first == "filter" && key == "cutoff") {
				loaded.filterParams.cutoffWavelength = parseDouble(qualified, value);
			} else if (section.first == "filter" && key == "sample_width") {
				loaded.filterParams.sampleWidth = parseDouble(qualified, value);
			} else if (section.first == "input" && key == "delimiter") {
				loaded.inputParams.delimiter = parseDelimiter(value);
			} else if (section.first == "input" && key == "strict_shape") {
				loaded.inputParams.strictShape = parseBool(qualified, value);
			} else if (section.first == "processing" && key == "threads") {
				loaded.processingParams.threads = parseInt(qualified, value);
			} else {
				throw ConfigurationError("Unknown configuration key: " + qualified);
			}
		}
	}

	*this = loaded;
	return true;
}

// ============================================
// Validation
// ============================================

bool DecompositionConfiguration::validate() const {
	if (!(this->filterParams.cutoffWavelength > 0.0) ||
		!(this->filterParams.sampleWidth > 0.0) ||
		this->processingParams.threads < 0) {
		return false;
	}
	const char delimiter = this->inputParams.delimiter;
	if (delimiter == '\n' || delimiter == '\r' || delimiter == '\0') {
		return false;
	}
	// Characters that can appear inside a sample value
	if (std::isalnum(static_cast<unsigned char>(delimiter)) ||
		delimiter == '.' || delimiter == '-' || delimiter == '+') {
		return false;
	}
	return true;
}

} // namespace ste
