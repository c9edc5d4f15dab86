#ifndef STE_DECOMPOSITIONCONFIGURATION_H
#define STE_DECOMPOSITIONCONFIGURATION_H

#include <string>
#include "export.h"


namespace ste {

class STE_API DecompositionConfiguration {
public:
	struct STE_API FilterParameters {
		double cutoffWavelength;  // same length unit as the height data
		double sampleWidth;       // physical width of the sampled area

		FilterParameters()
			: cutoffWavelength(80.0)
			, sampleWidth(643.0)  // 10x objective on Olympus LEXT
		{}
	};

	struct STE_API InputParameters {
		char delimiter;
		bool strictShape;  // reject non-square sample counts instead of truncating

		InputParameters()
			: delimiter(',')
			, strictShape(false)
		{}
	};

	struct STE_API ProcessingParameters {
		int threads;  // row-parallel workers, 0 = hardware concurrency

		ProcessingParameters()
			: threads(1)
		{}

		int getEffectiveThreadCount() const;
	};

	FilterParameters filterParams;
	InputParameters inputParams;
	ProcessingParameters processingParams;

	DecompositionConfiguration();

	// INI format with [filter], [input] and [processing] sections.
	// Return false if the file cannot be opened, throw ConfigurationError
	// on malformed content.
	bool saveToFile(const std::string& filepath) const;
	bool loadFromFile(const std::string& filepath);

	bool validate() const;
};

} // namespace ste

#endif // STE_DECOMPOSITIONCONFIGURATION_H
