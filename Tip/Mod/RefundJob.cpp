#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Gateway/GatewayIF.hpp"
#include"S/Bus.hpp"
#include"Tip/Mod/RefundJob.hpp"
#include"Tip/Mod/TaskRunner.hpp"
#include"Tip/Msg/TimerRefund.hpp"
#include"Tip/Refunder.hpp"
#include"Tip/Store.hpp"
#include"Tip/log.hpp"
#include<memory>
#include<vector>

namespace Tip { namespace Mod {

void RefundJob::start() {
	bus.subscribe<Msg::TimerRefund>([this](Msg::TimerRefund const& _) {
		return runner.launch("refund sweep", deadline, sweep());
	});
}

Ev::Io<void> RefundJob::sweep() {
	return store.find_expired_funded_vouchers()
		.then([this](std::vector<Voucher> vouchers) {
		auto pvs = std::make_shared<std::vector<Voucher>>(
			std::move(vouchers)
		);
		return Tip::log( bus, Info
			       , "RefundJob: %zu expired voucher(s) with balance"
			       , pvs->size()
			       ).then([this, pvs]() {
			return refund_from(pvs, 0);
		});
	}).catching<std::exception>([this](std::exception const& e) {
		return Tip::log( bus, Error
			       , "RefundJob: cannot list expired vouchers: %s"
			       , e.what()
			       );
	});
}

Ev::Io<void>
RefundJob::refund_from( std::shared_ptr<std::vector<Voucher>> vouchers
		      , std::size_t i
		      ) {
	if (i >= vouchers->size())
		return Ev::lift();
	return refund_one((*vouchers)[i]).then([]() {
		return Ev::yield();
	}).then([this, vouchers, i]() {
		return refund_from(vouchers, i + 1);
	});
}

Ev::Io<void> RefundJob::refund_one(Voucher v) {
	auto id = std::string(v.pay_id);
	auto address = v.lightning_address;
	auto pay_id = v.pay_id;
	return store.deactivate_for_refund(pay_id)
		.then([this, id, address, pay_id](Ln::Amount taken) {
		if (taken == Ln::Amount::msat(0))
			return Tip::log( bus, Debug
				       , "RefundJob: %s: already emptied"
				       , id.c_str()
				       );
		auto amount = std::string(taken);
		return Tip::log( bus, Info
			       , "RefundJob: %s: refunding %s to %s"
			       , id.c_str(), amount.c_str(), address.c_str()
			       ).then([this, address, taken]() {
			return refunder.refund(address, taken);
		}).then([ this, id, amount
			, address, pay_id, taken
			](Gateway::PayResult res) {
			switch (res.outcome) {
			case Gateway::PayResult::Success:
				return Tip::log( bus, Info
					       , "RefundJob: %s: refunded %s"
					       , id.c_str(), amount.c_str()
					       );
			case Gateway::PayResult::Failed:
				return Tip::log( bus, Warn
					       , "RefundJob: %s: refund failed, "
						 "reactivating: %s"
					       , id.c_str(), res.detail.c_str()
					       ).then([this, pay_id, taken]() {
					return store.reactivate_with_balance(
						pay_id, taken
					);
				}).catching<std::exception>([ this, id
							    , amount, address
							    ](std::exception const& e) {
					return Tip::log( bus, Error
						       , "CRITICAL: RefundJob: %s: "
							 "cannot reactivate, %s owed "
							 "to %s: %s"
						       , id.c_str(), amount.c_str()
						       , address.c_str(), e.what()
						       );
				});
			case Gateway::PayResult::Ambiguous:
				break;
			}
			return Tip::log( bus, Error
				       , "CRITICAL: RefundJob: %s: refund of %s "
					 "to %s has unknown outcome: %s"
				       , id.c_str(), amount.c_str()
				       , address.c_str(), res.detail.c_str()
				       );
		});
	}).catching<std::exception>([this, id](std::exception const& e) {
		return Tip::log( bus, Error
			       , "RefundJob: %s: %s"
			       , id.c_str(), e.what()
			       );
	});
}

}}
