#pragma once

// Shared library visibility macros:
//
// TILESTREAM_API - public symbol (exported from shared library)
// TILESTREAM_LOCAL - private symbol (not visible outside shared library)
//
// The library is built with `-fvisibility=hidden`, so only
// symbols explicitly marked with `TILESTREAM_API` are exported.

#ifndef _WIN32
	#define TILESTREAM_API __attribute__((visibility("default")))
	#define TILESTREAM_LOCAL __attribute__((visibility("hidden")))
#else
	#ifdef TILESTREAM_EXPORTS
		#define TILESTREAM_API __declspec(dllexport)
	#else
		#define TILESTREAM_API __declspec(dllimport)
	#endif
	#define TILESTREAM_LOCAL
#endif
