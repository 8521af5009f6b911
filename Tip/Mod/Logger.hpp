#ifndef TIP_MOD_LOGGER_HPP
#define TIP_MOD_LOGGER_HPP

#include"Tip/log.hpp"
#include<ostream>

namespace S { class Bus; }

namespace Tip { namespace Mod {

/** class Tip::Mod::Logger
 *
 * @brief writes `Tip::Msg::Log` messages at or
 * above a threshold to the given stream, one
 * line each, prefixed with the UTC time and
 * level.
 */
class Logger {
private:
	std::ostream& out;
	Tip::LogLevel threshold;

	void start(S::Bus& bus);

public:
	Logger( S::Bus& bus
	      , std::ostream& out_
	      , Tip::LogLevel threshold_ = Tip::Info
	      ) : out(out_), threshold(threshold_) {
		start(bus);
	}
};

}}

#endif /* !defined(TIP_MOD_LOGGER_HPP) */
