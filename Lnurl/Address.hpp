#ifndef LNURL_ADDRESS_HPP
#define LNURL_ADDRESS_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Lnurl {

/** Lnurl::AddressError
 *
 * @brief thrown on a malformed lightning address.
 */
class AddressError : public Util::BacktraceException<std::invalid_argument> {
public:
	explicit
	AddressError(std::string const& e
		    ) : Util::BacktraceException<std::invalid_argument>(
				"invalid lightning address: " + e
			) { }
};

/** class Lnurl::Address
 *
 * @brief a lightning address `user@domain`.
 *
 * @desc The user part is one or more of
 * `[A-Za-z0-9._%+-]`; the domain is one or more
 * of `[A-Za-z0-9.-]`, a dot, and a top-level
 * domain of two or more letters.
 */
class Address {
private:
	std::string u;
	std::string d;

public:
	Address() =delete;
	/* Throws `Lnurl::AddressError`.  */
	explicit
	Address(std::string const& text);

	static
	bool valid_string(std::string const& text);

	std::string const& user() const { return u; }
	std::string const& domain() const { return d; }

	explicit operator std::string() const {
		return u + "@" + d;
	}

	/* Where the LNURL-Pay parameters live.  */
	std::string well_known_url() const {
		return "https://" + d + "/.well-known/lnurlp/" + u;
	}
};

}

#endif /* !defined(LNURL_ADDRESS_HPP) */
