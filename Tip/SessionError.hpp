#ifndef TIP_SESSIONERROR_HPP
#define TIP_SESSIONERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Tip {

/** Tip::SessionError
 *
 * @brief thrown when a withdrawal session
 * cannot be consumed.
 *
 * @desc Every kind maps to the same LNURL
 * error; the kind is only for the logs.
 */
class SessionError : public Util::BacktraceException<std::runtime_error> {
public:
	enum Kind {
		NotFound,
		Mismatch,
		AlreadyUsed
	};

private:
	Kind k;

	static
	std::string describe(Kind k) {
		switch (k) {
		case NotFound: return "session not found";
		case Mismatch: return "session belongs to another voucher";
		case AlreadyUsed: return "session already used";
		}
		return "session error";
	}

public:
	explicit
	SessionError(Kind k_
		    ) : Util::BacktraceException<std::runtime_error>(describe(k_))
		      , k(k_)
		      { }

	Kind kind() const { return k; }
};

}

#endif /* !defined(TIP_SESSIONERROR_HPP) */
