#include "../../include/surfacedecomposition.h"
#include <stdexcept>
#include <string>

namespace ste {

SurfaceDecomposition::SurfaceDecomposition(
	ProfileGrid primary,
	WavinessGrid waviness,
	RoughnessGrid roughness,
	MetricSeries metrics,
	double cutoffWavelength,
	double sampleWidth,
	int stopIndex)
	: primary(std::move(primary))
	, waviness(std::move(waviness))
	, roughness(std::move(roughness))
	, metrics(std::move(metrics))
	, cutoffWavelength(cutoffWavelength)
	, sampleWidth(sampleWidth)
	, stopIndex(stopIndex)
{
	const int n = this->primary.getDimension();
	if (this->waviness.getDimension() != n || this->roughness.getDimension() != n) {
		throw std::invalid_argument("Decomposition grids must share the primary dimension");
	}
}

const ProfileGrid& SurfaceDecomposition::getPrimary() const {
	return this->primary;
}

const WavinessGrid& SurfaceDecomposition::getWaviness() const {
	return this->waviness;
}

const RoughnessGrid& SurfaceDecomposition::getRoughness() const {
	return this->roughness;
}

const MetricSeries& SurfaceDecomposition::getMetrics() const {
	return this->metrics;
}

const std::vector<double>& SurfaceDecomposition::getMetric(MetricType type) const {
	const std::string name = getMetricName(type);
	auto it = this->metrics.find(name);
	if (it == this->metrics.end()) {
		throw std::out_of_range("Metric " + name + " was not computed");
	}
	return it->second;
}

std::vector<double> SurfaceDecomposition::getCenteredMetric(MetricType type) const {
	const std::vector<double>& series = this->getMetric(type);
	if (series.empty()) {
		return std::vector<double>();
	}

	double sum = 0.0;
	for (double value : series) {
		sum += value;
	}
	const double mean = sum / static_cast<double>(series.size());

	std::vector<double> centered(series.size());
	for (size_t i = 0; i < series.size(); ++i) {
		centered[i] = series[i] - mean;
	}
	return centered;
}

SectionProfile SurfaceDecomposition::getSection(int rowIndex) const {
	SectionProfile section;
	section.rowIndex = rowIndex;
	section.primary = this->primary.getRow(rowIndex);
	section.waviness = this->waviness.getRow(rowIndex);
	section.roughness = this->roughness.getRow(rowIndex);
	section.position = this->getPositions();
	return section;
}

std::vector<double> SurfaceDecomposition::getPositions() const {
	const int n = this->primary.getDimension();
	std::vector<double> positions(n);
	if (n == 1) {
		positions[0] = 0.0;
	} else if (n > 1) {
		const double step = this->sampleWidth / static_cast<double>(n - 1);
		for (int i = 0; i < n; ++i) {
			positions[i] = step * i;
		}
		positions[n - 1] = this->sampleWidth;
	}
	return positions;
}

int SurfaceDecomposition::getDimension() const {
	return this->primary.getDimension();
}

double SurfaceDecomposition::getCutoffWavelength() const {
	return this->cutoffWavelength;
}

double SurfaceDecomposition::getSampleWidth() const {
	return this->sampleWidth;
}

int SurfaceDecomposition::getStopIndex() const {
	return this->stopIndex;
}

} // namespace ste
