#ifndef LNURL_RESOLVER_HPP
#define LNURL_RESOLVER_HPP

#include"Ln/Amount.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Http { class ClientIF; }

namespace Lnurl {

/** Lnurl::ResolveError
 *
 * @brief thrown when a lightning address or an
 * LNURL-Pay callback does not give us something
 * we can pay.
 */
class ResolveError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	ResolveError(std::string const& e
		    ) : Util::BacktraceException<std::runtime_error>(e) { }
};

struct PayParams {
	std::string callback;
	Ln::Amount min_sendable;
	Ln::Amount max_sendable;
};

/** class Lnurl::Resolver
 *
 * @brief the payer side of LNURL-Pay: finds the
 * parameters behind a lightning address and asks
 * its callback for an invoice.
 */
class Resolver {
private:
	Http::ClientIF& client;
	double timeout;

public:
	explicit
	Resolver( Http::ClientIF& client_
		, double timeout_ = 15
		) : client(client_), timeout(timeout_) { }

	/* Throws `Lnurl::AddressError` or
	 * `Lnurl::ResolveError`.  */
	Ev::Io<PayParams> resolve(std::string const& address);

	/* Yields the BOLT11 invoice for `amount`.
	 * Throws `Lnurl::ResolveError`.  */
	Ev::Io<std::string> fetch_invoice( std::string const& callback
					 , Ln::Amount amount
					 );
};

}

#endif /* !defined(LNURL_RESOLVER_HPP) */
