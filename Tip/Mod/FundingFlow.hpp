#ifndef TIP_MOD_FUNDINGFLOW_HPP
#define TIP_MOD_FUNDINGFLOW_HPP

#include"Ln/Amount.hpp"
#include"Uuid.hpp"
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Gateway { class GatewayIF; }
namespace Http { class Router; }
namespace Http { struct Request; }
namespace Http { struct Response; }
namespace S { class Bus; }
namespace Tip { struct Config; }
namespace Tip { class Refunder; }
namespace Tip { class Store; }
namespace Tip { namespace Mod { class TaskRunner; }}

namespace Tip { namespace Mod {

/** class Tip::Mod::FundingFlow
 *
 * @brief the LNURL-Pay side of a voucher.
 *
 * @desc `GET /pay/{pay_id}` describes the
 * voucher as a pay request;
 * `GET /pay/{pay_id}/callback?amount=` makes a
 * funding invoice for the amount.
 * Once the invoice is paid, the amount less the
 * funding fee is credited to the voucher if it
 * is still active.
 * If it is no longer active, that amount is
 * refunded to the voucher's lightning address.
 */
class FundingFlow {
private:
	S::Bus& bus;
	Tip::Store& store;
	Gateway::GatewayIF& gateway;
	Tip::Refunder& refunder;
	Tip::Mod::TaskRunner& runner;
	Tip::Config const& config;

	void start(Http::Router& router);

	Ev::Io<Http::Response> metadata(Http::Request req);
	Ev::Io<Http::Response> callback(Http::Request req);

	Ev::Io<void> confirm( Uuid pay_id
			    , std::string payment_hash
			    , Ln::Amount credited
			    );
	Ev::Io<void> refund_payer(Uuid pay_id, Ln::Amount credited);

public:
	FundingFlow( S::Bus& bus_
		   , Http::Router& router
		   , Tip::Store& store_
		   , Gateway::GatewayIF& gateway_
		   , Tip::Refunder& refunder_
		   , Tip::Mod::TaskRunner& runner_
		   , Tip::Config const& config_
		   ) : bus(bus_)
		     , store(store_)
		     , gateway(gateway_)
		     , refunder(refunder_)
		     , runner(runner_)
		     , config(config_)
		     {
		start(router);
	}

	/** Tip::Mod::FundingFlow::metadata_string
	 *
	 * @brief the LNURL-Pay `metadata` value, a
	 * JSON array of `[type, content]` pairs,
	 * itself written as a string.
	 */
	static std::string metadata_string();
};

}}

#endif /* !defined(TIP_MOD_FUNDINGFLOW_HPP) */
