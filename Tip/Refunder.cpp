#include"Ev/Io.hpp"
#include"Lnurl/Resolver.hpp"
#include"Tip/Refunder.hpp"
#include"Tip/log.hpp"
#include"Util/Str.hpp"
#include<memory>

namespace {

/* Thrown to skip to the `Failed` result.  */
struct NotPayable {
	std::string detail;
};

}

namespace Tip {

Ln::Amount Refunder::refund_amount( Ln::Amount amount
				  , Ln::Amount min_sendable
				  , Ln::Amount max_sendable
				  ) {
	if (amount < min_sendable)
		return Ln::Amount::msat(0);
	if (amount > max_sendable)
		amount = max_sendable;
	return amount.round_down_to_sat();
}

Ev::Io<Gateway::PayResult> Refunder::refund( std::string const& address
					   , Ln::Amount amount
					   ) {
	return Ev::lift().then([this, address]() {
		return resolver.resolve(address);
	}).then([this, address, amount](Lnurl::PayParams params) {
		auto to_pay = refund_amount( amount
					   , params.min_sendable
					   , params.max_sendable
					   );
		if (to_pay == Ln::Amount::msat(0))
			throw NotPayable{Util::Str::fmt(
				"refund of %s is dust (receiver minimum %s)",
				std::string(amount).c_str(),
				std::string(params.min_sendable).c_str()
			)};
		auto act = Ev::lift();
		if (amount > params.max_sendable)
			act = Tip::log( bus, Warn
				      , "Refunder: %s accepts at most %s; "
					"refunding %s of %s, forfeiting %s"
				      , address.c_str()
				      , std::string(params.max_sendable).c_str()
				      , std::string(to_pay).c_str()
				      , std::string(amount).c_str()
				      , std::string(amount - to_pay).c_str()
				      );
		auto callback = params.callback;
		return act.then([this, callback, to_pay]() {
			return resolver.fetch_invoice(callback, to_pay);
		});
	}).catching<std::exception>([](std::exception const& e) {
		throw NotPayable{e.what()};
		return Ev::lift(std::string());
	}).then([this](std::string invoice) {
		return gateway.pay_invoice(invoice);
	}).catching<NotPayable>([](NotPayable const& n) {
		return Ev::lift(Gateway::PayResult{
			Gateway::PayResult::Failed, n.detail
		});
	});
}

}
