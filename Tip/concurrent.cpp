#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Tip/Shutdown.hpp"
#include"Tip/concurrent.hpp"

namespace Tip {

Ev::Io<void> concurrent(Ev::Io<void> io) {
	return Ev::concurrent(io.catching<Tip::Shutdown>([](Tip::Shutdown const& _) {
		return Ev::lift();
	}));
}

}
