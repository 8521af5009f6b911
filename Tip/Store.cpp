#include"Ev/Io.hpp"
#include"Lnurl/K1.hpp"
#include"Sqlite3.hpp"
#include"Tip/SessionError.hpp"
#include"Tip/Store.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace {

/* Column list matching `read_voucher`.  */
char const* const voucher_columns = R"QRY(
	pay_id, withdraw_id, creation_request_hash, lightning_address
      , total_paid_msats, last_funded_at, expiry_seconds, active
      , created_at
)QRY";

Tip::Voucher read_voucher(Sqlite3::Row& r) {
	auto v = Tip::Voucher();
	v.pay_id = Uuid(r.get<std::string>(0));
	v.withdraw_id = Uuid(r.get<std::string>(1));
	if (!r.is_null(2))
		v.creation_request_hash = r.get<std::string>(2);
	v.lightning_address = r.get<std::string>(3);
	v.total_paid = Ln::Amount::msat(r.get<std::uint64_t>(4));
	v.funded = !r.is_null(5);
	if (v.funded)
		v.last_funded_at = r.get<double>(5);
	v.expiry_seconds = r.get<double>(6);
	v.active = r.get<bool>(7);
	v.created_at = r.get<double>(8);
	return v;
}

std::shared_ptr<Tip::Voucher>
load_voucher(Sqlite3::Tx& tx, char const* key, std::string const& id) {
	auto q = std::string("SELECT ") + voucher_columns
	       + " FROM vouchers WHERE " + key + " = :id;"
	       ;
	auto fetch = tx.query(q)
		.bind(":id", id)
		.execute()
		;
	for (auto& r : fetch)
		return std::make_shared<Tip::Voucher>(read_voucher(r));
	return nullptr;
}

bool hash_known(Sqlite3::Tx& tx, std::string const& payment_hash) {
	auto fetch = tx.query(R"QRY(
		SELECT 1 FROM voucher_creation_requests
		 WHERE payment_hash = :hash
		UNION ALL
		SELECT 1 FROM pay_invoices
		 WHERE payment_hash = :hash
		;
	)QRY")
		.bind(":hash", payment_hash)
		.execute()
		;
	for (auto& r : fetch) {
		(void) r;
		return true;
	}
	return false;
}

void reject_reused_hash(Sqlite3::Tx& tx, std::string const& payment_hash) {
	if (hash_known(tx, payment_hash))
		throw Util::BacktraceException<std::runtime_error>(
			"Tip::Store: payment hash already recorded: "
			+ payment_hash
		);
}

}

namespace Tip {

class Store::Impl {
private:
	Sqlite3::Db db;
	double abs_expiry;
	std::function<double()> clock;

	std::vector<Voucher>
	insert_batch( Sqlite3::Tx& tx
		    , std::string const& creation_request_hash
		    , std::string const& lightning_address
		    , std::uint32_t count
		    , double expiry_seconds
		    ) {
		auto rv = std::vector<Voucher>();
		auto t = clock();
		for (auto i = std::uint32_t(0); i < count; ++i) {
			auto v = Voucher();
			v.pay_id = Uuid::random();
			v.withdraw_id = Uuid::random();
			v.creation_request_hash = creation_request_hash;
			v.lightning_address = lightning_address;
			v.expiry_seconds = expiry_seconds;
			v.active = true;
			v.created_at = t;

			auto q = tx.query(R"QRY(
			INSERT INTO vouchers
			     ( pay_id, withdraw_id, creation_request_hash
			     , lightning_address, total_paid_msats
			     , last_funded_at, expiry_seconds, active
			     , created_at
			     )
			VALUES
			     ( :pay_id, :withdraw_id, :hash
			     , :address, 0
			     , NULL, :expiry, 1
			     , :now
			     );
			)QRY");
			q.bind(":pay_id", std::string(v.pay_id))
			 .bind(":withdraw_id", std::string(v.withdraw_id))
			 .bind(":address", lightning_address)
			 .bind(":expiry", expiry_seconds)
			 .bind(":now", t)
			 ;
			if (creation_request_hash.empty())
				q.bind(":hash", nullptr);
			else
				q.bind(":hash", creation_request_hash);
			q.execute();

			rv.push_back(std::move(v));
		}
		return rv;
	}

public:
	Impl( Sqlite3::Db db_
	    , double abs_expiry_
	    , std::function<double()> clock_
	    ) : db(std::move(db_))
	      , abs_expiry(abs_expiry_)
	      , clock(std::move(clock_))
	      { }

	double now() const { return clock(); }
	double absolute_expiry() const { return abs_expiry; }

	Ev::Io<void> init() {
		return db.transact().then([](Sqlite3::Tx tx) {
			tx.query_execute(R"QRY(
			CREATE TABLE IF NOT EXISTS voucher_creation_requests
			( payment_hash TEXT PRIMARY KEY
			, lightning_address TEXT NOT NULL
			, count INTEGER NOT NULL
			, expiry_seconds REAL NOT NULL
			, fee_msats INTEGER NOT NULL
			, status TEXT NOT NULL DEFAULT 'pending'
			, created_at REAL NOT NULL
			);
			CREATE TABLE IF NOT EXISTS vouchers
			( pay_id TEXT PRIMARY KEY
			, withdraw_id TEXT NOT NULL UNIQUE
			, creation_request_hash TEXT
				REFERENCES voucher_creation_requests(payment_hash)
			, lightning_address TEXT NOT NULL
			, total_paid_msats INTEGER NOT NULL DEFAULT 0
			, last_funded_at REAL
			, expiry_seconds REAL NOT NULL
			, active INTEGER NOT NULL DEFAULT 1
			, created_at REAL NOT NULL
			);
			CREATE INDEX IF NOT EXISTS idx_vouchers_withdraw_id
			    ON vouchers(withdraw_id);
			CREATE INDEX IF NOT EXISTS idx_vouchers_creation_hash
			    ON vouchers(creation_request_hash);
			CREATE INDEX IF NOT EXISTS idx_vouchers_refund
			    ON vouchers(active, total_paid_msats);
			CREATE TABLE IF NOT EXISTS pay_invoices
			( id TEXT PRIMARY KEY
			, pay_id TEXT NOT NULL REFERENCES vouchers(pay_id)
			, payment_hash TEXT NOT NULL UNIQUE
			, amount_msats INTEGER NOT NULL
			, credited_msats INTEGER NOT NULL
			, paid INTEGER NOT NULL DEFAULT 0
			, created_at REAL NOT NULL
			, paid_at REAL
			);
			CREATE INDEX IF NOT EXISTS idx_pay_invoices_pay_id
			    ON pay_invoices(pay_id);
			CREATE TABLE IF NOT EXISTS withdraw_sessions
			( k1 TEXT PRIMARY KEY
			, withdraw_id TEXT NOT NULL
				REFERENCES vouchers(withdraw_id)
			, created_at REAL NOT NULL
			, used INTEGER NOT NULL DEFAULT 0
			, used_at REAL
			);
			)QRY");
			tx.commit();
			return Ev::lift();
		});
	}

	Ev::Io<void> add_creation_request(CreationRequest req) {
		return db.transact().then([this, req](Sqlite3::Tx tx) {
			reject_reused_hash(tx, req.payment_hash);
			tx.query(R"QRY(
			INSERT INTO voucher_creation_requests
			     ( payment_hash, lightning_address, count
			     , expiry_seconds, fee_msats, status, created_at
			     )
			VALUES
			     ( :hash, :address, :count
			     , :expiry, :fee, :status, :now
			     );
			)QRY")
				.bind(":hash", req.payment_hash)
				.bind(":address", req.lightning_address)
				.bind(":count", req.count)
				.bind(":expiry", req.expiry_seconds)
				.bind(":fee", req.fee.to_msat())
				.bind(":status", CreationRequest::status_string(req.status))
				.bind(":now", clock())
				.execute()
				;
			tx.commit();
			return Ev::lift();
		});
	}

	Ev::Io<std::shared_ptr<CreationRequest>>
	get_creation_request(std::string const& payment_hash) {
		return db.transact().then([payment_hash](Sqlite3::Tx tx) {
			auto rv = std::shared_ptr<CreationRequest>();
			auto fetch = tx.query(R"QRY(
			SELECT lightning_address, count, expiry_seconds
			     , fee_msats, status, created_at
			  FROM voucher_creation_requests
			 WHERE payment_hash = :hash;
			)QRY")
				.bind(":hash", payment_hash)
				.execute()
				;
			for (auto& r : fetch) {
				rv = std::make_shared<CreationRequest>();
				rv->payment_hash = payment_hash;
				rv->lightning_address = r.get<std::string>(0);
				rv->count = r.get<std::uint32_t>(1);
				rv->expiry_seconds = r.get<double>(2);
				rv->fee = Ln::Amount::msat(r.get<std::uint64_t>(3));
				rv->status = CreationRequest::status_parse(
					r.get<std::string>(4)
				);
				rv->created_at = r.get<double>(5);
			}
			tx.commit();
			return Ev::lift(rv);
		});
	}

	Ev::Io<bool> complete_creation(std::string const& payment_hash) {
		return db.transact().then([this, payment_hash](Sqlite3::Tx tx) {
			auto fetch = tx.query(R"QRY(
			SELECT lightning_address, count, expiry_seconds
			  FROM voucher_creation_requests
			 WHERE payment_hash = :hash
			   AND status = 'pending';
			)QRY")
				.bind(":hash", payment_hash)
				.execute()
				;
			auto found = false;
			auto address = std::string();
			auto count = std::uint32_t(0);
			auto expiry = double(0);
			for (auto& r : fetch) {
				found = true;
				address = r.get<std::string>(0);
				count = r.get<std::uint32_t>(1);
				expiry = r.get<double>(2);
			}
			if (!found)
				return Ev::lift(false);

			insert_batch(tx, payment_hash, address, count, expiry);
			tx.query(R"QRY(
			UPDATE voucher_creation_requests
			   SET status = 'complete'
			 WHERE payment_hash = :hash;
			)QRY")
				.bind(":hash", payment_hash)
				.execute()
				;
			tx.commit();
			return Ev::lift(true);
		});
	}

	Ev::Io<bool> expire_creation(std::string const& payment_hash) {
		return db.transact().then([payment_hash](Sqlite3::Tx tx) {
			tx.query(R"QRY(
			UPDATE voucher_creation_requests
			   SET status = 'expired'
			 WHERE payment_hash = :hash
			   AND status = 'pending';
			)QRY")
				.bind(":hash", payment_hash)
				.execute()
				;
			auto changed = tx.changes() > 0;
			tx.commit();
			return Ev::lift(changed);
		});
	}

	Ev::Io<std::vector<Voucher>>
	get_batch(std::string const& payment_hash) {
		return db.transact().then([payment_hash](Sqlite3::Tx tx) {
			auto rv = std::vector<Voucher>();
			auto q = std::string("SELECT ") + voucher_columns
			       + " FROM vouchers"
				 " WHERE creation_request_hash = :hash"
				 " ORDER BY rowid;"
			       ;
			auto fetch = tx.query(q)
				.bind(":hash", payment_hash)
				.execute()
				;
			for (auto& r : fetch)
				rv.push_back(read_voucher(r));
			tx.commit();
			return Ev::lift(std::move(rv));
		});
	}

	Ev::Io<std::vector<Voucher>>
	create_batch( std::string const& creation_request_hash
		    , std::string const& lightning_address
		    , std::uint32_t count
		    , double expiry_seconds
		    ) {
		return db.transact().then([ this
					  , creation_request_hash
					  , lightning_address
					  , count
					  , expiry_seconds
					  ](Sqlite3::Tx tx) {
			auto rv = insert_batch( tx
					      , creation_request_hash
					      , lightning_address
					      , count
					      , expiry_seconds
					      );
			tx.commit();
			return Ev::lift(std::move(rv));
		});
	}

	Ev::Io<std::shared_ptr<Voucher>>
	get_voucher(char const* key, std::string const& id) {
		return db.transact().then([key, id](Sqlite3::Tx tx) {
			auto rv = load_voucher(tx, key, id);
			tx.commit();
			return Ev::lift(rv);
		});
	}

	Ev::Io<void> add_pay_invoice(PayInvoice inv) {
		return db.transact().then([this, inv](Sqlite3::Tx tx) {
			reject_reused_hash(tx, inv.payment_hash);
			tx.query(R"QRY(
			INSERT INTO pay_invoices
			     ( id, pay_id, payment_hash, amount_msats
			     , credited_msats, paid, created_at, paid_at
			     )
			VALUES
			     ( :id, :pay_id, :hash, :amount
			     , :credited, 0, :now, NULL
			     );
			)QRY")
				.bind(":id", std::string(inv.id))
				.bind(":pay_id", std::string(inv.pay_id))
				.bind(":hash", inv.payment_hash)
				.bind(":amount", inv.amount.to_msat())
				.bind(":credited", inv.credited.to_msat())
				.bind(":now", clock())
				.execute()
				;
			tx.commit();
			return Ev::lift();
		});
	}

	Ev::Io<std::vector<PayInvoice>> get_paid_invoices(Uuid const& pay_id) {
		return db.transact().then([pay_id](Sqlite3::Tx tx) {
			auto rv = std::vector<PayInvoice>();
			auto fetch = tx.query(R"QRY(
			SELECT id, payment_hash, amount_msats, credited_msats
			     , created_at, paid_at
			  FROM pay_invoices
			 WHERE pay_id = :pay_id
			   AND paid = 1
			 ORDER BY paid_at;
			)QRY")
				.bind(":pay_id", std::string(pay_id))
				.execute()
				;
			for (auto& r : fetch) {
				auto inv = PayInvoice();
				inv.id = Uuid(r.get<std::string>(0));
				inv.pay_id = pay_id;
				inv.payment_hash = r.get<std::string>(1);
				inv.amount = Ln::Amount::msat(r.get<std::uint64_t>(2));
				inv.credited = Ln::Amount::msat(r.get<std::uint64_t>(3));
				inv.paid = true;
				inv.created_at = r.get<double>(4);
				inv.paid_at = r.get<double>(5);
				rv.push_back(std::move(inv));
			}
			tx.commit();
			return Ev::lift(std::move(rv));
		});
	}

	Ev::Io<bool> credit_if_active( Uuid const& pay_id
				     , Ln::Amount credited
				     , std::string const& payment_hash
				     ) {
		return db.transact().then([ this
					  , pay_id
					  , credited
					  , payment_hash
					  ](Sqlite3::Tx tx) {
			auto t = clock();
			auto v = load_voucher(tx, "pay_id", std::string(pay_id));
			if (!v || !v->is_active(t, abs_expiry))
				/* Rolled back on destruction.  */
				return Ev::lift(false);

			/* Each invoice credits at most once.  */
			tx.query(R"QRY(
			UPDATE pay_invoices
			   SET paid = 1
			     , paid_at = :now
			 WHERE payment_hash = :hash
			   AND pay_id = :pay_id
			   AND paid = 0;
			)QRY")
				.bind(":now", t)
				.bind(":hash", payment_hash)
				.bind(":pay_id", std::string(pay_id))
				.execute()
				;
			if (tx.changes() != 1)
				throw Util::BacktraceException<std::runtime_error>(
					"Tip::Store: invoice unknown or already "
					"credited: " + payment_hash
				);

			tx.query(R"QRY(
			UPDATE vouchers
			   SET total_paid_msats = total_paid_msats + :credited
			     , last_funded_at = :now
			 WHERE pay_id = :pay_id;
			)QRY")
				.bind(":credited", credited.to_msat())
				.bind(":now", t)
				.bind(":pay_id", std::string(pay_id))
				.execute()
				;
			tx.commit();
			return Ev::lift(true);
		});
	}

	Ev::Io<void> deactivate_for_withdrawal(Uuid const& pay_id) {
		return db.transact().then([pay_id](Sqlite3::Tx tx) {
			tx.query(R"QRY(
			UPDATE vouchers
			   SET total_paid_msats = 0
			     , active = 0
			 WHERE pay_id = :pay_id;
			)QRY")
				.bind(":pay_id", std::string(pay_id))
				.execute()
				;
			if (tx.changes() == 0)
				throw Util::BacktraceException<std::runtime_error>(
					"Tip::Store: no voucher to deactivate: "
					+ std::string(pay_id)
				);
			tx.commit();
			return Ev::lift();
		});
	}

	Ev::Io<Ln::Amount> reserve_for_withdrawal(Uuid const& pay_id) {
		return db.transact().then([this, pay_id](Sqlite3::Tx tx) {
			auto v = load_voucher(tx, "pay_id", std::string(pay_id));
			if ( !v || !v->is_active(clock(), abs_expiry)
			  || v->total_paid == Ln::Amount::msat(0)
			   )
				return Ev::lift(Ln::Amount::msat(0));
			tx.query(R"QRY(
			UPDATE vouchers
			   SET total_paid_msats = 0
			     , active = 0
			 WHERE pay_id = :pay_id
			   AND active = 1;
			)QRY")
				.bind(":pay_id", std::string(pay_id))
				.execute()
				;
			if (tx.changes() != 1)
				return Ev::lift(Ln::Amount::msat(0));
			tx.commit();
			return Ev::lift(v->total_paid);
		});
	}

	Ev::Io<Ln::Amount> deactivate_for_refund(Uuid const& pay_id) {
		return db.transact().then([pay_id](Sqlite3::Tx tx) {
			auto v = load_voucher(tx, "pay_id", std::string(pay_id));
			if ( !v || !v->active
			  || v->total_paid == Ln::Amount::msat(0)
			   )
				return Ev::lift(Ln::Amount::msat(0));
			tx.query(R"QRY(
			UPDATE vouchers
			   SET total_paid_msats = 0
			     , active = 0
			 WHERE pay_id = :pay_id;
			)QRY")
				.bind(":pay_id", std::string(pay_id))
				.execute()
				;
			tx.commit();
			return Ev::lift(v->total_paid);
		});
	}

	Ev::Io<void> reactivate_with_balance( Uuid const& pay_id
					    , Ln::Amount balance
					    ) {
		return db.transact().then([pay_id, balance](Sqlite3::Tx tx) {
			tx.query(R"QRY(
			UPDATE vouchers
			   SET total_paid_msats = :balance
			     , active = 1
			 WHERE pay_id = :pay_id;
			)QRY")
				.bind(":balance", balance.to_msat())
				.bind(":pay_id", std::string(pay_id))
				.execute()
				;
			if (tx.changes() == 0)
				throw Util::BacktraceException<std::runtime_error>(
					"Tip::Store: no voucher to reactivate: "
					+ std::string(pay_id)
				);
			tx.commit();
			return Ev::lift();
		});
	}

	Ev::Io<void> add_withdraw_session( Lnurl::K1 const& k1
					 , Uuid const& withdraw_id
					 ) {
		return db.transact().then([this, k1, withdraw_id](Sqlite3::Tx tx) {
			tx.query(R"QRY(
			INSERT INTO withdraw_sessions
			     (k1, withdraw_id, created_at, used, used_at)
			VALUES
			     (:k1, :withdraw_id, :now, 0, NULL);
			)QRY")
				.bind(":k1", std::string(k1))
				.bind(":withdraw_id", std::string(withdraw_id))
				.bind(":now", clock())
				.execute()
				;
			tx.commit();
			return Ev::lift();
		});
	}

	Ev::Io<Uuid> validate_and_consume_session( Lnurl::K1 const& k1
						 , Uuid const& withdraw_id
						 ) {
		return db.transact().then([this, k1, withdraw_id](Sqlite3::Tx tx) {
			auto fetch = tx.query(R"QRY(
			SELECT withdraw_id, used
			  FROM withdraw_sessions
			 WHERE k1 = :k1;
			)QRY")
				.bind(":k1", std::string(k1))
				.execute()
				;
			auto found = false;
			auto owner = std::string();
			auto used = false;
			for (auto& r : fetch) {
				found = true;
				owner = r.get<std::string>(0);
				used = r.get<bool>(1);
			}
			if (!found)
				throw SessionError(SessionError::NotFound);
			if (owner != std::string(withdraw_id))
				throw SessionError(SessionError::Mismatch);
			if (used)
				throw SessionError(SessionError::AlreadyUsed);

			tx.query(R"QRY(
			UPDATE withdraw_sessions
			   SET used = 1
			     , used_at = :now
			 WHERE k1 = :k1
			   AND used = 0;
			)QRY")
				.bind(":now", clock())
				.bind(":k1", std::string(k1))
				.execute()
				;
			if (tx.changes() == 0)
				throw SessionError(SessionError::AlreadyUsed);

			auto v = load_voucher( tx, "withdraw_id"
					     , std::string(withdraw_id)
					     );
			if (!v)
				throw SessionError(SessionError::NotFound);

			tx.commit();
			return Ev::lift(v->pay_id);
		});
	}

	Ev::Io<std::vector<Voucher>> find_expired_funded_vouchers() {
		return db.transact().then([this](Sqlite3::Tx tx) {
			auto rv = std::vector<Voucher>();
			auto q = std::string("SELECT ") + voucher_columns
			       + R"QRY(
			  FROM vouchers
			 WHERE active = 1
			   AND total_paid_msats > 0
			   AND ( ( last_funded_at IS NOT NULL
			       AND :now - last_funded_at >= expiry_seconds
				 )
			      OR :now - created_at >= :absolute
			       )
			 ORDER BY created_at;
			)QRY";
			auto fetch = tx.query(q)
				.bind(":now", clock())
				.bind(":absolute", abs_expiry)
				.execute()
				;
			for (auto& r : fetch)
				rv.push_back(read_voucher(r));
			tx.commit();
			return Ev::lift(std::move(rv));
		});
	}
};

Store::Store( Sqlite3::Db db
	    , double absolute_expiry
	    , std::function<double()> clock
	    ) : pimpl(std::make_shared<Impl>( std::move(db)
					    , absolute_expiry
					    , std::move(clock)
					    ))
	      { }
Store::~Store() { }

Ev::Io<void> Store::init() {
	return pimpl->init();
}
double Store::now() const {
	return pimpl->now();
}
double Store::absolute_expiry() const {
	return pimpl->absolute_expiry();
}

Ev::Io<void> Store::add_creation_request(CreationRequest req) {
	return pimpl->add_creation_request(std::move(req));
}
Ev::Io<std::shared_ptr<CreationRequest>>
Store::get_creation_request(std::string const& payment_hash) {
	return pimpl->get_creation_request(payment_hash);
}
Ev::Io<bool> Store::complete_creation(std::string const& payment_hash) {
	return pimpl->complete_creation(payment_hash);
}
Ev::Io<bool> Store::expire_creation(std::string const& payment_hash) {
	return pimpl->expire_creation(payment_hash);
}
Ev::Io<std::vector<Voucher>>
Store::get_batch(std::string const& payment_hash) {
	return pimpl->get_batch(payment_hash);
}
Ev::Io<std::vector<Voucher>>
Store::create_batch( std::string const& creation_request_hash
		   , std::string const& lightning_address
		   , std::uint32_t count
		   , double expiry_seconds
		   ) {
	return pimpl->create_batch( creation_request_hash
				  , lightning_address
				  , count
				  , expiry_seconds
				  );
}

Ev::Io<std::shared_ptr<Voucher>> Store::get_by_pay_id(Uuid const& pay_id) {
	return pimpl->get_voucher("pay_id", std::string(pay_id));
}
Ev::Io<std::shared_ptr<Voucher>>
Store::get_by_withdraw_id(Uuid const& withdraw_id) {
	return pimpl->get_voucher("withdraw_id", std::string(withdraw_id));
}

Ev::Io<void> Store::add_pay_invoice(PayInvoice inv) {
	return pimpl->add_pay_invoice(std::move(inv));
}
Ev::Io<std::vector<PayInvoice>>
Store::get_paid_invoices(Uuid const& pay_id) {
	return pimpl->get_paid_invoices(pay_id);
}
Ev::Io<bool> Store::credit_if_active( Uuid const& pay_id
				    , Ln::Amount credited
				    , std::string const& payment_hash
				    ) {
	return pimpl->credit_if_active(pay_id, credited, payment_hash);
}

Ev::Io<void> Store::deactivate_for_withdrawal(Uuid const& pay_id) {
	return pimpl->deactivate_for_withdrawal(pay_id);
}
Ev::Io<Ln::Amount> Store::reserve_for_withdrawal(Uuid const& pay_id) {
	return pimpl->reserve_for_withdrawal(pay_id);
}
Ev::Io<Ln::Amount> Store::deactivate_for_refund(Uuid const& pay_id) {
	return pimpl->deactivate_for_refund(pay_id);
}
Ev::Io<void> Store::reactivate_with_balance( Uuid const& pay_id
					   , Ln::Amount balance
					   ) {
	return pimpl->reactivate_with_balance(pay_id, balance);
}

Ev::Io<void> Store::add_withdraw_session( Lnurl::K1 const& k1
					, Uuid const& withdraw_id
					) {
	return pimpl->add_withdraw_session(k1, withdraw_id);
}
Ev::Io<Uuid> Store::validate_and_consume_session( Lnurl::K1 const& k1
						, Uuid const& withdraw_id
						) {
	return pimpl->validate_and_consume_session(k1, withdraw_id);
}

Ev::Io<std::vector<Voucher>> Store::find_expired_funded_vouchers() {
	return pimpl->find_expired_funded_vouchers();
}

}
