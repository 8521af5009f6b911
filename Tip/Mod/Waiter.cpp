#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"S/Bus.hpp"
#include"Tip/Mod/Waiter.hpp"
#include"Tip/Shutdown.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<list>

namespace Tip { namespace Mod {

class Waiter::Impl {
private:
	typedef std::function<void()> PassF;
	typedef std::function<void(std::exception_ptr)> FailF;

	/* Attached to each running ev_timer.  */
	struct Info {
		Impl *pimpl;
		PassF pass;
		FailF fail;
		std::list<ev_timer>::iterator it;
	};
	std::list<ev_timer> timers;

	static
	void fail_shutdown(FailF const& fail) {
		try {
			throw Tip::Shutdown();
		} catch (...) {
			fail(std::current_exception());
		}
	}

	void shutdown() {
		is_shutting_down = true;
		/* Handlers may start new waits; those fail
		 * immediately, so this is the final list.  */
		auto pending = std::move(timers);
		timers.clear();
		for (auto& timer : pending) {
			auto info = std::unique_ptr<Info>((Info*) timer.data);
			ev_timer_stop(EV_DEFAULT_ &timer);
			fail_shutdown(info->fail);
		}
	}

	static
	void timer_static_handler(EV_P_ ev_timer *timer, int revents) {
		auto info = std::unique_ptr<Info>((Info*)timer->data);
		auto pass = std::move(info->pass);
		ev_timer_stop(EV_A_ timer);
		info->pimpl->timers.erase(info->it);
		pass();
	}

	/* Shared between the action and its deadline;
	 * the first to finish wins.  */
	struct Race {
		PassF pass;
		FailF fail;
		bool done;
		/* Whether `timer` is still running.  */
		bool armed;
		std::list<ev_timer>::iterator timer;
	};

public:
	bool is_shutting_down;

	explicit
	Impl(S::Bus& bus) : is_shutting_down(false) {
		bus.subscribe<Tip::Shutdown>([this](Tip::Shutdown const& _) {
			shutdown();
			return Ev::lift();
		});
	}
	~Impl() {
		for (auto& timer : timers) {
			auto info = std::unique_ptr<Info>((Info*) timer.data);
			ev_timer_stop(EV_DEFAULT_ &timer);
		}
	}

	std::list<ev_timer>::iterator
	start_timer(double seconds, PassF pass, FailF fail) {
		auto it = timers.emplace( timers.begin()
					, ev_timer()
					);
		ev_timer_init(&*it, &timer_static_handler, seconds, 0);
		auto info = Util::make_unique<Info>();
		info->pimpl = this;
		info->pass = std::move(pass);
		info->fail = std::move(fail);
		info->it = it;
		it->data = info.release();
		ev_timer_start(EV_DEFAULT_ &*it);
		return it;
	}
	/* Stops a timer that has not fired yet, without
	 * resuming its waiter.  */
	void cancel_timer(std::list<ev_timer>::iterator it) {
		/* shutdown() owns every timer from then on.  */
		if (is_shutting_down)
			return;
		auto info = std::unique_ptr<Info>((Info*) it->data);
		ev_timer_stop(EV_DEFAULT_ &*it);
		timers.erase(it);
	}

	Ev::Io<void> wait(double seconds) {
		return Ev::Io<void>([ this
				    , seconds
				    ]( PassF pass
				     , FailF fail
				     ) {
			if (is_shutting_down)
				return fail_shutdown(fail);
			start_timer(seconds, std::move(pass), std::move(fail));
		});
	}

	Ev::Io<void> timed_core(double timeout, Ev::Io<void> action) {
		return Ev::Io<void>([ this
				    , timeout
				    , action
				    ]( PassF pass
				     , FailF fail
				     ) {
			if (is_shutting_down)
				return fail_shutdown(fail);

			auto race = std::make_shared<Race>();
			race->pass = std::move(pass);
			race->fail = std::move(fail);
			race->done = false;
			race->armed = false;

			auto finish = [this, race]() {
				race->done = true;
				if (race->armed) {
					race->armed = false;
					cancel_timer(race->timer);
				}
			};
			auto sub_pass = [race, finish]() {
				if (race->done)
					return;
				finish();
				auto pass = std::move(race->pass);
				race->fail = nullptr;
				pass();
			};
			auto sub_fail = [race, finish](std::exception_ptr e) {
				if (race->done)
					return;
				finish();
				auto fail = std::move(race->fail);
				race->pass = nullptr;
				fail(e);
			};
			auto on_timeout = [race, sub_fail]() {
				/* The timer has already been released.  */
				race->armed = false;
				try {
					throw TimedOut{};
				} catch (...) {
					sub_fail(std::current_exception());
				}
			};
			auto on_shutdown = [race, sub_fail](std::exception_ptr e) {
				race->armed = false;
				sub_fail(e);
			};
			race->timer = start_timer(timeout, on_timeout, on_shutdown);
			race->armed = true;
			action.run(sub_pass, sub_fail);
		}).then([]() {
			return Ev::yield();
		});
	}
};

Waiter::Waiter(S::Bus& bus) : pimpl(Util::make_unique<Impl>(bus)) {}
Waiter::~Waiter() { }

Ev::Io<void> Waiter::wait(double seconds) {
	return pimpl->wait(seconds);
}
Ev::Io<void> Waiter::timed_core(double timeout, Ev::Io<void> action) {
	return pimpl->timed_core(timeout, std::move(action));
}
bool Waiter::shutting_down() const {
	return pimpl->is_shutting_down;
}

}}
