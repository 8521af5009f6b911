#ifndef TIP_FEE_HPP
#define TIP_FEE_HPP

#include"Ln/Amount.hpp"

namespace Tip {

/** Tip::funding_fee
 *
 * @brief the part of a funding payment the
 * service keeps: the larger of `min_fee` and
 * `percent` of `amount`, rounded down.
 */
inline
Ln::Amount funding_fee( Ln::Amount amount
		      , Ln::Amount min_fee
		      , double percent
		      ) {
	auto prop = amount.fraction(percent);
	return prop > min_fee ? prop : min_fee;
}

}

#endif /* !defined(TIP_FEE_HPP) */
