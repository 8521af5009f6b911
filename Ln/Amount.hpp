#ifndef LN_AMOUNT_HPP
#define LN_AMOUNT_HPP

#include<cstdint>
#include<iostream>
#include<string>

namespace Jsmn { class Object; }

namespace Ln {

/** class Ln::Amount
 *
 * @brief represents some amount of Bitcoins, in
 * millisatoshi.
 *
 * @desc Subtraction saturates at zero and addition
 * at the maximum, so a balance can never wrap.
 */
class Amount {
private:
	/* In millisatoshi.  */
	std::uint64_t v;

public:
	Amount() : v(0) { }
	Amount(Amount const&) =default;
	Amount& operator=(Amount const&) =default;
	~Amount() =default;

	/* "<n>msat", for logs.  */
	explicit
	operator std::string() const;

	static
	Amount sat(std::uint64_t v) {
		auto ret = Amount();
		ret.v = v * 1000;
		return ret;
	}
	static
	Amount msat(std::uint64_t v) {
		auto ret = Amount();
		ret.v = v;
		return ret;
	}

	std::uint64_t to_msat() const { return v; }
	/* Whole satoshis, rounding down.  */
	std::uint64_t to_sat() const { return v / 1000; }
	Amount round_down_to_sat() const {
		return Amount::sat(to_sat());
	}

	/* The given fraction of this amount, rounded down.  */
	Amount fraction(double f) const {
		return Amount::msat(std::uint64_t(double(v) * f));
	}

	/* A JSON number holding a non-negative whole number of
	 * millisatoshi.  */
	static
	bool valid_object(Jsmn::Object const&);
	static
	Amount object(Jsmn::Object const&);

	Amount& operator+=(Amount const& i) {
		v += i.v;
		if (v < i.v)
			v = UINT64_MAX;
		return *this;
	}
	Amount operator+(Amount const& i) const {
		return Amount(*this) += i;
	}
	Amount& operator-=(Amount const& i) {
		if (i.v > v)
			v = 0;
		else
			v -= i.v;
		return *this;
	}
	Amount operator-(Amount const& i) const {
		return Amount(*this) -= i;
	}

	bool operator<(Amount const& o) const {
		return v < o.v;
	}
	bool operator>(Amount const& o) const {
		return o < (*this);
	}
	bool operator<=(Amount const& o) const {
		return !(*this > o);
	}
	bool operator>=(Amount const& o) const {
		return o <= (*this);
	}
	bool operator==(Amount const& o) const {
		return v == o.v;
	}
	bool operator!=(Amount const& o) const {
		return !(*this == o);
	}
};

inline
std::ostream& operator<<(std::ostream& os, Amount const& v) {
	return os << std::string(v);
}

}

#endif /* !defined(LN_AMOUNT_HPP) */
