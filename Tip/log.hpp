#ifndef TIP_LOG_HPP
#define TIP_LOG_HPP

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Tip {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 3, 4)))
#endif
;

/* "TRACE", "DEBUG", and so on.  */
std::string log_level_name(LogLevel l);
/* Parses "trace", "debug", "info", "warn" or "error".
 * Returns false on anything else.  */
bool log_level_parse(LogLevel& l, std::string const& s);

}

#endif /* TIP_LOG_HPP */
