#ifndef LNURL_K1_HPP
#define LNURL_K1_HPP

#include<cstdint>
#include<memory>
#include<string>

namespace Lnurl {

/** class Lnurl::K1
 *
 * @brief the one-time 256-bit nonce that binds an
 * LNURL-Withdraw callback to the session that
 * issued it.
 *
 * @desc Written as 64 hex digits on the wire.
 */
class K1 {
private:
	struct Impl {
		std::uint8_t data[32];
	};
	std::shared_ptr<Impl> pimpl;

public:
	K1() =default;

	/* 32 fresh random bytes.  */
	static K1 random();

	bool operator==(K1 const& o) const;
	bool operator!=(K1 const& o) const {
		return !(*this == o);
	}

	explicit operator bool() const { return !!pimpl; }

	explicit operator std::string() const;
	explicit K1(std::string const&);
	static
	bool valid_string(std::string const&);
};

}

#endif /* !defined(LNURL_K1_HPP) */
