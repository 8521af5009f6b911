#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"S/Bus.hpp"
#include"Tip/Msg/Log.hpp"
#include"Tip/Msg/TimerRefund.hpp"
#include<assert.h>
#include<memory>
#include<stdexcept>
#include<string>

Ev::Io<void> io_main() {
	auto bus = std::make_shared<S::Bus>();
	auto sweeps = std::make_shared<int>(0);
	auto logs = std::make_shared<std::string>();
	return Ev::yield().then([=]() {
		/* Nobody listening yet.  */
		return bus->raise(Tip::Msg::TimerRefund{});
	}).then([=]() {
		bus->subscribe<Tip::Msg::TimerRefund>([=](Tip::Msg::TimerRefund const&) {
			++*sweeps;
			return Ev::lift();
		});
		return bus->raise(Tip::Msg::Log{
			Tip::Info, "hello"
		});
	}).then([=]() {
		/* Types are strict.  */
		assert(*sweeps == 0);
		return bus->raise(Tip::Msg::TimerRefund{});
	}).then([=]() {
		assert(*sweeps == 1);

		/* Multiple subscribers all get the message.  */
		bus->subscribe<Tip::Msg::Log>([=](Tip::Msg::Log const& l) {
			*logs += l.message;
			return Ev::lift();
		});
		bus->subscribe<Tip::Msg::Log>([=](Tip::Msg::Log const& l) {
			if (l.level == Tip::Error)
				*logs += "!";
			return Ev::lift();
		});
		return bus->raise(Tip::Msg::Log{
			Tip::Error, "oops"
		});
	}).then([=]() {
		assert(*logs == "oops!" || *logs == "!oops");
		return bus->raise(Tip::Msg::Log{
			Tip::Debug, "x"
		});
	}).then([=]() {
		assert(*logs == "oops!x" || *logs == "!oopsx");

		/* A failing subscriber fails the raise.  */
		bus->subscribe<Tip::Msg::TimerRefund>([](Tip::Msg::TimerRefund const&) {
			return Ev::lift().then([]() {
				throw std::runtime_error("sweep failed");
				return Ev::lift();
			});
		});
		return bus->raise(Tip::Msg::TimerRefund{}).then([]() {
			return Ev::lift(false);
		}).catching<std::runtime_error>([](std::runtime_error const& e) {
			assert(std::string(e.what()) == "sweep failed");
			return Ev::lift(true);
		});
	}).then([=](bool failed) {
		assert(failed);
		assert(*sweeps == 2);
		return Ev::lift();
	});
}

int main() {
	return Ev::start(io_main().then([](){
		return Ev::lift(0);
	}));
}
