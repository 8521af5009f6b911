#ifndef GATEWAY_BLITZI_HPP
#define GATEWAY_BLITZI_HPP

#include"Gateway/GatewayIF.hpp"
#include<memory>
#include<string>

namespace Http { class ClientIF; }
namespace Tip { namespace Mod { class Waiter; }}

namespace Gateway {

/** class Gateway::Blitzi
 *
 * @brief talks to a blitzi Lightning daemon over
 * its REST API.
 */
class Blitzi : public GatewayIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Blitzi() =delete;
	Blitzi(Blitzi const&) =delete;

	Blitzi( Http::ClientIF& client
	      , Tip::Mod::Waiter& waiter
	      /* e.g. "http://localhost:3000" */
	      , std::string base_url
	      /* Empty for no Authorization header.  */
	      , std::string token
	      , double poll_interval = 2
	      );
	~Blitzi();

	Ev::Io<Invoice> create_invoice( Ln::Amount amount
				      , std::string const& description
				      ) override;
	Ev::Io<bool> wait_for_payment( std::string const& payment_hash
				     , double timeout
				     ) override;
	Ev::Io<PayResult> pay_invoice(std::string const& bolt11) override;
};

}

#endif /* !defined(GATEWAY_BLITZI_HPP) */
