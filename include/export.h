#ifndef STE_EXPORT_H
#define STE_EXPORT_H

#if defined(_WIN32) || defined(_WIN64)
	#ifdef BUILD_STE_LIBRARY
		#define STE_API __declspec(dllexport)
	#else
		#define STE_API __declspec(dllimport)
	#endif
#elif defined(__GNUC__) || defined(__clang__)
	#ifdef BUILD_STE_LIBRARY
		#define STE_API __attribute__((visibility("default")))
	#else
		#define STE_API
	#endif
#else
	#define STE_API
#endif

#endif // STE_EXPORT_H
