#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"S/Bus.hpp"
#include"Tip/Mod/Logger.hpp"
#include"Tip/Msg/Log.hpp"
#include"Util/date.hpp"

namespace Tip { namespace Mod {

void Logger::start(S::Bus& bus) {
	bus.subscribe<Msg::Log>([this](Msg::Log const& l) {
		if (l.level < threshold)
			return Ev::lift();
		out << Util::date(Ev::now()) << " "
		    << Tip::log_level_name(l.level) << " "
		    << l.message
		    << std::endl
		    ;
		return Ev::lift();
	});
}

}}
