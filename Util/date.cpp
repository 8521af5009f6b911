#include"Util/date.hpp"
#include<cstdint>
#include<inttypes.h>
#include<math.h>
#include<stdio.h>
#include<time.h>

namespace {

std::string format(double epoch, char const* tpl) {
	auto seconds = time_t(floor(epoch));
	auto split = tm();
	(void) gmtime_r(&seconds, &split);

	char buffer[64];
	buffer[0] = '\0';
	(void) strftime(buffer, sizeof(buffer), tpl, &split);
	return std::string(buffer);
}

}

namespace Util {

std::string date(double epoch) {
	auto base = format(epoch, "%Y-%m-%d %H:%M:%S");

	auto subsecond = epoch - floor(epoch);
	auto milliseconds = std::uint32_t(floor(subsecond * 1000));
	/* In case of roundoff error.  */
	if (milliseconds > 999)
		milliseconds = 999;

	char ms[8];
	(void) snprintf(ms, sizeof(ms), ".%03" PRIu32, milliseconds);
	return base + ms;
}

std::string rfc3339(double epoch) {
	return format(epoch, "%Y-%m-%dT%H:%M:%SZ");
}

}
