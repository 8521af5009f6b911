#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"S/Bus.hpp"
#include"Tip/Mod/Waiter.hpp"
#include"Tip/Shutdown.hpp"
#include<assert.h>
#include<memory>
#include<string>

namespace {

typedef Tip::Mod::Waiter::TimedOut TimedOut;

Ev::Io<std::size_t> count_down( Tip::Mod::Waiter& waiter
			       , std::size_t counter
			       , std::size_t ok
			       ) {
	if (counter == 0)
		return Ev::lift(ok);
	/* Yield should complete first.  */
	auto action = Ev::yield().then([]() {
		return Ev::lift(true);
	});
	return waiter.timed(60, action)
		.catching<TimedOut>([](TimedOut const& _) {
		return Ev::lift(false);
	}).then([&waiter, counter, ok](bool flag) {
		return count_down(waiter, counter - 1, flag ? ok + 1 : ok);
	});
}

}

int main() {
	S::Bus bus;
	Tip::Mod::Waiter waiter(bus);

	auto shutdown_seen = false;

	auto code = Ev::lift().then([&]() {

		/* Trivial timed.  */
		return waiter.timed(60, Ev::lift(std::string("payment")));
	}).then([&](std::string s) {
		assert(s == "payment");

		/* Core operation delays, but completes first.  */
		return waiter.timed(60, waiter.wait(0.001));
	}).then([&]() {

		/* Timeout reached first.  */
		return waiter.timed(0.001, waiter.wait(60).then([]() {
			return Ev::lift(true);
		})).catching<TimedOut>([](TimedOut const& _) {
			return Ev::lift(false);
		});
	}).then([&](bool flag) {
		assert(!flag);

		return count_down(waiter, 1000, 0);
	}).then([&](std::size_t ok) {
		assert(ok == 1000);

		/* Cancel all pending waiters.  */
		return bus.raise(Tip::Shutdown());
	}).then([&]() {
		/* Later waits fail at once.  */
		return waiter.wait(60).catching<Tip::Shutdown>([&](Tip::Shutdown const& _) {
			shutdown_seen = true;
			return Ev::lift();
		});
	}).then([&]() {
		assert(shutdown_seen);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
