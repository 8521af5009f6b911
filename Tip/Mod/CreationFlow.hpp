#ifndef TIP_MOD_CREATIONFLOW_HPP
#define TIP_MOD_CREATIONFLOW_HPP

#include<string>

namespace Ev { template<typename a> class Io; }
namespace Gateway { class GatewayIF; }
namespace Http { class Router; }
namespace Http { struct Request; }
namespace Http { struct Response; }
namespace S { class Bus; }
namespace Tip { struct Config; }
namespace Tip { class Store; }
namespace Tip { namespace Mod { class TaskRunner; }}

namespace Tip { namespace Mod {

/** class Tip::Mod::CreationFlow
 *
 * @brief sells batches of vouchers.
 *
 * @desc `POST /api/vouchers/invoice` answers
 * with an invoice for the creation fee and
 * records a pending creation request.
 * A background task then waits for the invoice
 * to be paid, and either inserts the batch and
 * marks the request complete, or marks it
 * expired.
 * `GET /api/vouchers/status/{payment_hash}`
 * reports the request and, once complete, the
 * LNURLs of its vouchers.
 */
class CreationFlow {
private:
	S::Bus& bus;
	Tip::Store& store;
	Gateway::GatewayIF& gateway;
	Tip::Mod::TaskRunner& runner;
	Tip::Config const& config;

	void start(Http::Router& router);

	Ev::Io<Http::Response> create(Http::Request req);
	Ev::Io<Http::Response> status(Http::Request req);

	Ev::Io<void> confirm(std::string const& payment_hash);

public:
	CreationFlow( S::Bus& bus_
		    , Http::Router& router
		    , Tip::Store& store_
		    , Gateway::GatewayIF& gateway_
		    , Tip::Mod::TaskRunner& runner_
		    , Tip::Config const& config_
		    ) : bus(bus_)
		      , store(store_)
		      , gateway(gateway_)
		      , runner(runner_)
		      , config(config_)
		      {
		start(router);
	}
};

}}

#endif /* !defined(TIP_MOD_CREATIONFLOW_HPP) */
