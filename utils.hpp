#ifndef UTILS_HPP
#define UTILS_HPP

#include <chrono>
#include <iomanip>
#include <ostream>

struct _FormatMillis {
	long millis;
};

inline _FormatMillis formatMillis(long millis) {
	return { millis };
}

// monotonic milliseconds since some unspecified start point
inline long millis() {
	return (long)std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::steady_clock::now().time_since_epoch()).count();
}

template<typename _CharT, typename _Traits> inline std::basic_ostream<_CharT, _Traits>& 
	operator<<(std::basic_ostream<_CharT, _Traits>& os, _FormatMillis millis) { 
		float val = millis.millis / 1000.0f;
		const char *unit = "seconds";

		if (val > 60) {
			val /= 60;
			unit = val > 1 ? "minutes" : "minute";
		}

		if (val > 90) {
			val /= 60;
			unit = val > 1 ? "hours" : "hour";
		}

		return os << std::fixed << std::setprecision(1) << val << " " << unit;
	}

#endif
