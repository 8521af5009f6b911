#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include"Tip/Mod/Timers.hpp"
#include"Tip/Mod/Waiter.hpp"
#include"Tip/Msg/Begin.hpp"
#include"Tip/Msg/TimerRefund.hpp"
#include"Tip/concurrent.hpp"
#include"Tip/log.hpp"

namespace Tip { namespace Mod {

void Timers::start() {
	bus.subscribe<Msg::Begin>([this](Msg::Begin const& _) {
		return Tip::concurrent(refund_loop());
	});
}

Ev::Io<void> Timers::refund_loop() {
	return Ev::lift().then([this]() {
		return Tip::log( bus, Debug
			       , "Timers: triggering refund sweep"
			       );
	}).then([this]() {
		return Tip::concurrent(bus.raise(Msg::TimerRefund()));
	}).then([this]() {
		return waiter.wait(refund_interval);
	}).then([this]() {
		return refund_loop();
	});
}

}}
