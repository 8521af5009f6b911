#ifndef TIP_MOD_TASKRUNNER_HPP
#define TIP_MOD_TASKRUNNER_HPP

#include<cstddef>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }
namespace Tip { namespace Mod { class Waiter; }}

namespace Tip { namespace Mod {

/** class Tip::Mod::TaskRunner
 *
 * @brief launches detached background tasks that
 * outlive the request that started them.
 *
 * @desc Each task runs in its own greenthread,
 * bounded by its own deadline.
 * A task cancelled by `Tip::Shutdown` ends
 * silently; a task that misses its deadline is
 * logged as a warning; any other exception is
 * logged as an error.
 * Nothing a task throws reaches the launcher.
 */
class TaskRunner {
private:
	S::Bus& bus;
	Tip::Mod::Waiter& waiter;
	std::size_t count;

public:
	TaskRunner( S::Bus& bus_
		  , Tip::Mod::Waiter& waiter_
		  ) : bus(bus_), waiter(waiter_), count(0) { }

	/** Tip::Mod::TaskRunner::launch
	 *
	 * @brief schedules `task` and returns at once.
	 * The task is abandoned after `deadline`
	 * seconds.
	 */
	Ev::Io<void> launch( std::string name
			   , double deadline
			   , Ev::Io<void> task
			   );

	/* Number of launched tasks that have not ended.  */
	std::size_t running() const { return count; }
};

}}

#endif /* !defined(TIP_MOD_TASKRUNNER_HPP) */
