#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include"Tip/Msg/Log.hpp"
#include"Tip/log.hpp"
#include"Util/Str.hpp"
#include<stdarg.h>

namespace Tip {

Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...) {
	va_list ap;

	auto msg = std::string();

	va_start(ap, fmt);
	msg = Util::Str::vfmt(fmt, ap);
	va_end(ap);

	return bus.raise(Tip::Msg::Log{l, std::move(msg)});
}

std::string log_level_name(LogLevel l) {
	switch (l) {
	case Trace: return "TRACE";
	case Debug: return "DEBUG";
	case Info: return "INFO";
	case Warn: return "WARN";
	case Error: return "ERROR";
	}
	return "UNKNOWN";
}

bool log_level_parse(LogLevel& l, std::string const& s) {
	if (s == "trace")
		l = Trace;
	else if (s == "debug")
		l = Debug;
	else if (s == "info")
		l = Info;
	else if (s == "warn")
		l = Warn;
	else if (s == "error")
		l = Error;
	else
		return false;
	return true;
}

}
