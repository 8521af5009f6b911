#ifndef TIP_MOD_WAITER_HPP
#define TIP_MOD_WAITER_HPP

#include"Ev/Io.hpp"
#include<memory>

namespace S { class Bus; }

namespace Tip { namespace Mod {

/** class Tip::Mod::Waiter
 *
 * @brief sleeps and deadlines for greenthreads.
 *
 * @desc Every pending wait is failed with a
 * `Tip::Shutdown` exception once `Tip::Shutdown`
 * is raised on the bus, and later waits fail
 * immediately.
 */
class Waiter {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	explicit
	Waiter(S::Bus& bus);
	~Waiter();

	/** Tip::Mod::Waiter::wait
	 *
	 * @brief Waits for the specified number of
	 * seconds, then the action returns.
	 */
	Ev::Io<void> wait(double seconds);

	/** Tip::Mod::Waiter::timed
	 *
	 * @brief performs the action, but if it does
	 * not complete before the given timeout,
	 * throws a `TimedOut` exception within the
	 * `Ev::Io` system.
	 *
	 * @desc The action cannot be cancelled, so it
	 * still runs to completion after the timeout;
	 * its result is then dropped.
	 */
	template<typename a>
	Ev::Io<a> timed( double timeout
		       , Ev::Io<a> action
		       );
	struct TimedOut { };

	bool shutting_down() const;

private:
	Ev::Io<void> timed_core( double timeout
			       , Ev::Io<void> action
			       );
};

template<typename a>
inline
Ev::Io<a> Waiter::timed( double timeout
		       , Ev::Io<a> action
		       ) {
	auto presult = std::make_shared<std::shared_ptr<a>>();
	auto core = action.then([presult](a value) {
		*presult = std::make_shared<a>(std::move(value));
		return Ev::lift();
	});
	return timed_core(timeout, core).then([presult]() {
		return Ev::lift(std::move(**presult));
	});
}
template<>
inline
Ev::Io<void> Waiter::timed<void>( double timeout
				, Ev::Io<void> action
				) {
	return timed_core(timeout, std::move(action));
}

}}

#endif /* !defined(TIP_MOD_WAITER_HPP) */
