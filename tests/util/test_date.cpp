#undef NDEBUG
#include"Util/date.hpp"
#include<assert.h>

int main() {
	assert(Util::date(0.0) == "1970-01-01 00:00:00.000");
	assert(Util::date(1.1) == "1970-01-01 00:00:01.100");

	assert(Util::rfc3339(0.0) == "1970-01-01T00:00:00Z");
	/* Fractions are dropped.  */
	assert(Util::rfc3339(1.9) == "1970-01-01T00:00:01Z");
	assert(Util::rfc3339(1767323045.0) == "2026-01-02T03:04:05Z");

	return 0;
}
