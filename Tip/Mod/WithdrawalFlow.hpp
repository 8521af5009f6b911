#ifndef TIP_MOD_WITHDRAWALFLOW_HPP
#define TIP_MOD_WITHDRAWALFLOW_HPP

#include"Ln/Amount.hpp"
#include"Uuid.hpp"
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Gateway { class GatewayIF; }
namespace Gateway { struct PayResult; }
namespace Http { class Router; }
namespace Http { struct Request; }
namespace Http { struct Response; }
namespace S { class Bus; }
namespace Tip { struct Config; }
namespace Tip { class Store; }

namespace Tip { namespace Mod {

/** class Tip::Mod::WithdrawalFlow
 *
 * @brief the LNURL-Withdraw side of a voucher.
 *
 * @desc `GET /withdraw/{withdraw_id}` issues a
 * one-time `k1` for the whole balance;
 * `GET /withdraw/{withdraw_id}/callback?k1=&pr=`
 * consumes the `k1` and pays the invoice `pr`.
 *
 * The balance is reserved, emptying and
 * deactivating the voucher, before the gateway
 * is asked to pay, so concurrent callbacks on
 * one voucher pay at most once.
 * How the payment ended then decides the
 * voucher's fate:
 *
 * - success: the voucher stays emptied, and
 *   the wallet is told OK even if confirming
 *   the deactivation fails.
 * - definite failure: the balance is put back
 *   and the voucher reactivated, so the holder
 *   can retry.
 * - unknown outcome: the voucher is emptied and
 *   deactivated anyway, so it can never pay out
 *   twice.
 */
class WithdrawalFlow {
private:
	S::Bus& bus;
	Tip::Store& store;
	Gateway::GatewayIF& gateway;
	Tip::Config const& config;

	void start(Http::Router& router);

	Ev::Io<Http::Response> metadata(Http::Request req);
	Ev::Io<Http::Response> callback(Http::Request req);

	/* The balance is already reserved.  */
	Ev::Io<Http::Response> pay_out( Uuid pay_id
				      , Ln::Amount balance
				      , std::string pr
				      );
	Ev::Io<Http::Response> settle( Uuid pay_id
				     , Ln::Amount balance
				     , Gateway::PayResult res
				     );

public:
	WithdrawalFlow( S::Bus& bus_
		      , Http::Router& router
		      , Tip::Store& store_
		      , Gateway::GatewayIF& gateway_
		      , Tip::Config const& config_
		      ) : bus(bus_)
			, store(store_)
			, gateway(gateway_)
			, config(config_)
			{
		start(router);
	}
};

}}

#endif /* !defined(TIP_MOD_WITHDRAWALFLOW_HPP) */
