#ifndef TIP_REFUNDER_HPP
#define TIP_REFUNDER_HPP

#include"Gateway/GatewayIF.hpp"
#include"Ln/Amount.hpp"
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Lnurl { class Resolver; }
namespace S { class Bus; }

namespace Tip {

/** class Tip::Refunder
 *
 * @brief pays an amount to a lightning address.
 *
 * @desc Anything that goes wrong before the
 * gateway is asked to pay (a bad address, a
 * failed resolution, an amount below the
 * receiver's minimum, no invoice) is a `Failed`
 * outcome; after that the gateway's outcome is
 * the result.
 * Amounts above the receiver's maximum are
 * capped, then rounded down to whole satoshis;
 * the part that is capped off is forfeited, and
 * logged as a warning.
 */
class Refunder {
private:
	S::Bus& bus;
	Lnurl::Resolver& resolver;
	Gateway::GatewayIF& gateway;

public:
	Refunder( S::Bus& bus_
		, Lnurl::Resolver& resolver_
		, Gateway::GatewayIF& gateway_
		) : bus(bus_), resolver(resolver_), gateway(gateway_) { }

	Ev::Io<Gateway::PayResult> refund( std::string const& address
					 , Ln::Amount amount
					 );

	/** Tip::Refunder::refund_amount
	 *
	 * @brief applies the receiver's bounds to
	 * `amount`.
	 * Returns zero if the amount is dust.
	 */
	static
	Ln::Amount refund_amount( Ln::Amount amount
				, Ln::Amount min_sendable
				, Ln::Amount max_sendable
				);
};

}

#endif /* !defined(TIP_REFUNDER_HPP) */
