#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"S/Bus.hpp"
#include"Tip/Mod/Logger.hpp"
#include"Tip/Mod/TaskRunner.hpp"
#include"Tip/Mod/Timers.hpp"
#include"Tip/Mod/Waiter.hpp"
#include"Tip/Msg/Begin.hpp"
#include"Tip/Msg/TimerRefund.hpp"
#include"Tip/Shutdown.hpp"
#include"Tip/log.hpp"
#include<assert.h>
#include<sstream>
#include<stdexcept>

namespace {

bool contains(std::ostringstream const& os, std::string const& s) {
	return os.str().find(s) != std::string::npos;
}

Ev::Io<void> drain(Tip::Mod::TaskRunner& runner) {
	return Ev::yield().then([&runner]() {
		if (runner.running() == 0)
			return Ev::lift();
		return drain(runner);
	});
}

}

int main() {
	auto bus = S::Bus();
	auto os = std::ostringstream();
	Tip::Mod::Logger logger(bus, os, Tip::Info);
	Tip::Mod::Waiter waiter(bus);
	Tip::Mod::TaskRunner runner(bus, waiter);
	Tip::Mod::Timers timers(bus, waiter, 0.01);

	auto ticks = std::size_t(0);
	bus.subscribe<Tip::Msg::TimerRefund>([&](Tip::Msg::TimerRefund const& _) {
		++ticks;
		return Ev::lift();
	});

	auto done = false;
	auto cancelled_ran_on = false;

	auto code = Ev::lift().then([&]() {
		return Tip::log(bus, Tip::Debug, "hidden %d", 1);
	}).then([&]() {
		return Tip::log(bus, Tip::Warn, "shown %d", 2);
	}).then([&]() {
		assert(!contains(os, "hidden"));
		assert(contains(os, "WARN shown 2"));

		/* A task that finishes.  */
		return runner.launch("quick", 60, Ev::lift().then([&]() {
			done = true;
			return Ev::lift();
		}));
	}).then([&]() {
		/* Launching does not wait for the task.  */
		assert(!done);
		assert(runner.running() == 1);

		/* A task that fails never fails the launcher.  */
		return runner.launch("boom", 60, Ev::lift().then([]() {
			throw std::runtime_error("kaboom");
			return Ev::lift();
		}));
	}).then([&]() {
		/* A task that misses its deadline.  */
		return runner.launch("slow", 0.01, waiter.wait(60));
	}).then([&]() {
		return drain(runner);
	}).then([&]() {
		assert(done);
		assert(contains(os, "ERROR TaskRunner: boom: kaboom"));
		assert(contains(os, "WARN TaskRunner: slow: abandoned after"));

		/* Periodic refund trigger.  */
		return bus.raise(Tip::Msg::Begin());
	}).then([&]() {
		return waiter.wait(0.1);
	}).then([&]() {
		assert(ticks >= 2);

		/* Shutdown cancels a waiting task silently.  */
		return runner.launch("long", 3600, waiter.wait(3600).then([&]() {
			cancelled_ran_on = true;
			return Ev::lift();
		}));
	}).then([&]() {
		return Ev::yield();
	}).then([&]() {
		return Ev::yield();
	}).then([&]() {
		assert(runner.running() == 1);
		return bus.raise(Tip::Shutdown());
	}).then([&]() {
		return drain(runner);
	}).then([&]() {
		assert(!cancelled_ran_on);
		assert(!contains(os, "TaskRunner: long"));
		assert(waiter.shutting_down());

		return Ev::lift(0);
	});

	return Ev::start(code);
}
