#ifndef TIP_MOD_REFUNDJOB_HPP
#define TIP_MOD_REFUNDJOB_HPP

#include"Tip/Voucher.hpp"
#include<cstddef>
#include<memory>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }
namespace Tip { class Refunder; }
namespace Tip { class Store; }
namespace Tip { namespace Mod { class TaskRunner; }}

namespace Tip { namespace Mod {

/** class Tip::Mod::RefundJob
 *
 * @brief returns the balance of expired vouchers
 * to their owners' lightning addresses.
 *
 * @desc On each `Tip::Msg::TimerRefund`, sweeps
 * the expired funded vouchers one at a time.
 * Each voucher is emptied and deactivated
 * before it is refunded, so no later sweep can
 * refund it again.
 * A refund that definitely failed puts the
 * balance back and reactivates the voucher, so
 * the next sweep retries it; a refund with an
 * unknown outcome leaves it deactivated and is
 * logged for manual reconciliation.
 */
class RefundJob {
private:
	S::Bus& bus;
	Tip::Store& store;
	Tip::Refunder& refunder;
	Tip::Mod::TaskRunner& runner;
	double deadline;

	void start();

	Ev::Io<void>
	refund_from( std::shared_ptr<std::vector<Voucher>> vouchers
		   , std::size_t i
		   );
	Ev::Io<void> refund_one(Voucher v);

public:
	RefundJob( S::Bus& bus_
		 , Tip::Store& store_
		 , Tip::Refunder& refunder_
		 , Tip::Mod::TaskRunner& runner_
		 , double deadline_
		 ) : bus(bus_)
		   , store(store_)
		   , refunder(refunder_)
		   , runner(runner_)
		   , deadline(deadline_)
		   {
		start();
	}

	/* One sweep.  Never fails except by
	 * `Tip::Shutdown`.  */
	Ev::Io<void> sweep();
};

}}

#endif /* !defined(TIP_MOD_REFUNDJOB_HPP) */
