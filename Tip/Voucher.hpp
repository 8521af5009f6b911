#ifndef TIP_VOUCHER_HPP
#define TIP_VOUCHER_HPP

#include"Ln/Amount.hpp"
#include"Uuid.hpp"
#include<string>

namespace Tip {

/** struct Tip::Voucher
 *
 * @brief one redeemable voucher, as stored.
 *
 * @desc Times are seconds since the epoch.
 */
struct Voucher {
	Uuid pay_id;
	Uuid withdraw_id;
	/* Empty if the voucher was not made by a
	 * creation request.  */
	std::string creation_request_hash;
	std::string lightning_address;
	Ln::Amount total_paid;
	bool funded;
	/* Only meaningful if `funded`.  */
	double last_funded_at;
	/* Relative expiry after each funding.  */
	double expiry_seconds;
	bool active;
	double created_at;

	Voucher() : funded(false)
		  , last_funded_at(0)
		  , expiry_seconds(0)
		  , active(false)
		  , created_at(0)
		  { }

	/** Tip::Voucher::is_active
	 *
	 * @brief whether the voucher can be funded
	 * and withdrawn at time `now`.
	 *
	 * @desc The `active` flag must be set, `now`
	 * must not be past `created_at + absolute_expiry`,
	 * and if the voucher was ever funded, `now`
	 * must not be past `last_funded_at + expiry_seconds`.
	 */
	bool is_active(double now, double absolute_expiry) const {
		if (!active)
			return false;
		if (now > created_at + absolute_expiry)
			return false;
		if (funded && now > last_funded_at + expiry_seconds)
			return false;
		return true;
	}

	/* The earliest time at which `is_active` turns
	 * false by expiry alone.  */
	double effective_expiry(double absolute_expiry) const {
		auto rv = created_at + absolute_expiry;
		if (funded && last_funded_at + expiry_seconds < rv)
			rv = last_funded_at + expiry_seconds;
		return rv;
	}
};

/** struct Tip::CreationRequest
 *
 * @brief a batch of vouchers bought with one
 * invoice, keyed by that invoice's payment hash.
 */
struct CreationRequest {
	enum Status {
		Pending,
		Complete,
		Expired
	};

	std::string payment_hash;
	std::string lightning_address;
	std::uint32_t count;
	double expiry_seconds;
	Ln::Amount fee;
	Status status;
	double created_at;

	CreationRequest() : count(0)
			  , expiry_seconds(0)
			  , status(Pending)
			  , created_at(0)
			  { }

	/* "pending", "complete" or "expired".  */
	static std::string status_string(Status);
	static Status status_parse(std::string const&);
};

/** struct Tip::PayInvoice
 *
 * @brief one funding attempt of a voucher.
 */
struct PayInvoice {
	Uuid id;
	Uuid pay_id;
	std::string payment_hash;
	/* What the payer is asked to pay.  */
	Ln::Amount amount;
	/* What the voucher gains once paid.  */
	Ln::Amount credited;
	bool paid;
	double created_at;
	/* Only meaningful if `paid`.  */
	double paid_at;

	PayInvoice() : paid(false), created_at(0), paid_at(0) { }
};

}

#endif /* !defined(TIP_VOUCHER_HPP) */
