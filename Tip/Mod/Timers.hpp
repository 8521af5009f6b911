#ifndef TIP_MOD_TIMERS_HPP
#define TIP_MOD_TIMERS_HPP

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }
namespace Tip { namespace Mod { class Waiter; }}

namespace Tip { namespace Mod {

/** class Tip::Mod::Timers
 *
 * @brief emits `Tip::Msg::TimerRefund` once at
 * `Tip::Msg::Begin` and then every
 * `refund_interval` seconds until shutdown.
 */
class Timers {
private:
	S::Bus& bus;
	Tip::Mod::Waiter& waiter;
	double refund_interval;

	Ev::Io<void> refund_loop();

	void start();

public:
	Timers( S::Bus& bus_
	      , Tip::Mod::Waiter& waiter_
	      , double refund_interval_
	      ) : bus(bus_)
		, waiter(waiter_)
		, refund_interval(refund_interval_)
		{
		start();
	}
};

}}

#endif /* TIP_MOD_TIMERS_HPP */
