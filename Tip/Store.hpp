#ifndef TIP_STORE_HPP
#define TIP_STORE_HPP

#include"Ln/Amount.hpp"
#include"Tip/Voucher.hpp"
#include<cstdint>
#include<functional>
#include<memory>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Lnurl { class K1; }
namespace Sqlite3 { class Db; }

namespace Tip {

/** class Tip::Store
 *
 * @brief the persistent state of every voucher,
 * funding invoice, withdrawal session and
 * creation request.
 *
 * @desc Each operation is one database
 * transaction, so every check-then-act below
 * is atomic with respect to every other
 * operation on the same `Sqlite3::Db`.
 * Operations that look a single row up return
 * a null pointer when there is no such row.
 */
class Store {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

public:
	Store() =delete;
	Store( Sqlite3::Db db
	     , double absolute_expiry
	     , std::function<double()> clock
	     );
	Store(Store const&) =default;
	~Store();

	/* Creates the tables and indexes if missing.  */
	Ev::Io<void> init();

	/* Current time according to the store's clock.  */
	double now() const;
	double absolute_expiry() const;

	/* Creation requests.  */
	Ev::Io<void> add_creation_request(CreationRequest req);
	Ev::Io<std::shared_ptr<CreationRequest>>
	get_creation_request(std::string const& payment_hash);
	/** Tip::Store::complete_creation
	 *
	 * @brief inserts the batch of a pending
	 * creation request and marks it complete.
	 * Returns false, changing nothing, if the
	 * request is unknown or no longer pending.
	 */
	Ev::Io<bool> complete_creation(std::string const& payment_hash);
	/* Marks a pending request expired.  Returns
	 * false if it was not pending.  */
	Ev::Io<bool> expire_creation(std::string const& payment_hash);
	/* Vouchers made by a creation request.  */
	Ev::Io<std::vector<Voucher>>
	get_batch(std::string const& payment_hash);

	/** Tip::Store::create_batch
	 *
	 * @brief inserts `count` fresh vouchers with
	 * zero balance and the active flag set.
	 * `creation_request_hash` may be empty.
	 */
	Ev::Io<std::vector<Voucher>>
	create_batch( std::string const& creation_request_hash
		    , std::string const& lightning_address
		    , std::uint32_t count
		    , double expiry_seconds
		    );

	/* Vouchers.  */
	Ev::Io<std::shared_ptr<Voucher>> get_by_pay_id(Uuid const& pay_id);
	Ev::Io<std::shared_ptr<Voucher>>
	get_by_withdraw_id(Uuid const& withdraw_id);

	/* Funding.  */
	Ev::Io<void> add_pay_invoice(PayInvoice inv);
	Ev::Io<std::vector<PayInvoice>> get_paid_invoices(Uuid const& pay_id);
	/** Tip::Store::credit_if_active
	 *
	 * @brief if the voucher is active, adds
	 * `credited` to its balance, stamps its
	 * funding time, and marks the invoice
	 * `payment_hash` paid.
	 * Returns false, changing nothing, if the
	 * voucher is not active.
	 *
	 * @desc Throws, changing nothing, if the
	 * invoice is not one of the voucher's or was
	 * already credited.
	 */
	Ev::Io<bool> credit_if_active( Uuid const& pay_id
				     , Ln::Amount credited
				     , std::string const& payment_hash
				     );

	/** Tip::Store::reserve_for_withdrawal
	 *
	 * @brief if the voucher is active with a
	 * positive balance, zeroes the balance,
	 * clears the active flag, and returns the
	 * balance taken.
	 * Otherwise returns zero, changing nothing.
	 *
	 * @desc Of any number of concurrent callers
	 * at most one gets a nonzero amount.
	 */
	Ev::Io<Ln::Amount> reserve_for_withdrawal(Uuid const& pay_id);
	/* Zeroes the balance and clears the active flag.  */
	Ev::Io<void> deactivate_for_withdrawal(Uuid const& pay_id);
	/** Tip::Store::deactivate_for_refund
	 *
	 * @brief if the voucher has the active flag
	 * and a positive balance, zeroes the balance,
	 * clears the flag, and returns the balance
	 * taken.
	 * Otherwise returns zero, changing nothing.
	 */
	Ev::Io<Ln::Amount> deactivate_for_refund(Uuid const& pay_id);
	/* Restores the balance and sets the active flag.  */
	Ev::Io<void> reactivate_with_balance( Uuid const& pay_id
					    , Ln::Amount balance
					    );

	/* Withdrawal sessions.  */
	Ev::Io<void> add_withdraw_session( Lnurl::K1 const& k1
					 , Uuid const& withdraw_id
					 );
	/** Tip::Store::validate_and_consume_session
	 *
	 * @brief marks the session `k1` used and
	 * returns the `pay_id` of its voucher.
	 *
	 * @desc Throws `Tip::SessionError` if the
	 * session does not exist, belongs to another
	 * `withdraw_id`, or was already used.
	 */
	Ev::Io<Uuid> validate_and_consume_session( Lnurl::K1 const& k1
						 , Uuid const& withdraw_id
						 );

	/** Tip::Store::find_expired_funded_vouchers
	 *
	 * @brief vouchers with the active flag and a
	 * positive balance that have passed their
	 * relative or absolute expiry.
	 */
	Ev::Io<std::vector<Voucher>> find_expired_funded_vouchers();
};

}

#endif /* !defined(TIP_STORE_HPP) */
