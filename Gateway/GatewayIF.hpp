#ifndef GATEWAY_GATEWAYIF_HPP
#define GATEWAY_GATEWAYIF_HPP

#include"Ln/Amount.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Ev { template<typename a> class Io; }

namespace Gateway {

struct Invoice {
	std::string payment_hash;
	/* BOLT11 text.  */
	std::string invoice;
};

/** struct Gateway::PayResult
 *
 * @brief how an outbound payment ended.
 *
 * @desc `Ambiguous` means the gateway may or may
 * not have paid; the caller must assume it did
 * when deciding whether to pay again.
 */
struct PayResult {
	enum Outcome {
		Success,
		Failed,
		Ambiguous
	};
	Outcome outcome;
	std::string detail;

	static std::string outcome_string(Outcome o) {
		switch (o) {
		case Success: return "success";
		case Failed: return "failed";
		case Ambiguous: return "ambiguous";
		}
		return "ambiguous";
	}
};

/** Gateway::ApiError
 *
 * @brief thrown when the gateway answers with an
 * error or with something unreadable.
 */
class ApiError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	ApiError(std::string const& e
		) : Util::BacktraceException<std::runtime_error>(e) { }
};

/** class Gateway::GatewayIF
 *
 * @brief interface to the Lightning payment
 * backend.
 */
class GatewayIF {
public:
	virtual ~GatewayIF() { }

	/* Throws `Gateway::ApiError` or `Http::ClientError`.  */
	virtual
	Ev::Io<Invoice> create_invoice( Ln::Amount amount
				      , std::string const& description
				      ) =0;

	/** Gateway::GatewayIF::wait_for_payment
	 *
	 * @brief yields true once the invoice is paid,
	 * or false once `timeout` seconds pass without
	 * payment.
	 * Throws `Tip::Shutdown` if cancelled.
	 */
	virtual
	Ev::Io<bool> wait_for_payment( std::string const& payment_hash
				     , double timeout
				     ) =0;

	/* Never throws for payment failures; they are
	 * classified in the result.  */
	virtual
	Ev::Io<PayResult> pay_invoice(std::string const& bolt11) =0;
};

}

#endif /* !defined(GATEWAY_GATEWAYIF_HPP) */
