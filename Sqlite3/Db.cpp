#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Util/BacktraceException.hpp"
#include"Sqlite3/Db.hpp"
#include"Sqlite3/Tx.hpp"
#include<functional>
#include<queue>
#include<stdexcept>
#include<sqlite3.h>

namespace Sqlite3 {

class Db::Impl {
private:
	sqlite3* connection;

	bool in_transaction;
	/* Greenthreads blocked on transact(), in arrival order.  */
	struct Blocked {
		std::function<void(Sqlite3::Tx)> pass;
		std::function<void(std::exception_ptr)> fail;
	};
	std::queue<Blocked> blocked;

public:
	Impl(std::string const& filename) {
		in_transaction = false;
		auto res = sqlite3_open(filename.c_str(), &connection);
		if (res != SQLITE_OK) {
			auto msg = std::string();
			if (connection) {
				msg = std::string(sqlite3_errmsg(connection));
				sqlite3_close_v2(connection);
				connection = nullptr;
			} else
				msg = "Not enough memory";
			throw Util::BacktraceException<std::runtime_error>(
				std::string("Sqlite3::Db: sqlite3_open: ") +
				msg
			);
		}
		res = sqlite3_extended_result_codes(connection, 1);
		if (res != SQLITE_OK) {
			auto msg = std::string(sqlite3_errmsg(connection));
			sqlite3_close_v2(connection);
			connection = nullptr;
			throw Util::BacktraceException<std::runtime_error>(
				std::string("Sqlite3::Db: sqlite3_extended_result_codes: ") +
				msg
			);
		}
		pragma("PRAGMA foreign_keys = ON;");
		/* Other writers (an operator's sqlite3 shell) get
		 * a grace period instead of failing us outright.  */
		pragma("PRAGMA busy_timeout = 5000;");
		if (filename != ":memory:" && filename != "")
			pragma("PRAGMA journal_mode = WAL;");
	}
	void pragma(char const* sql) {
		auto res = sqlite3_exec(connection, sql, NULL, NULL, NULL);
		if (res != SQLITE_OK) {
			auto msg = std::string(sqlite3_errmsg(connection));
			sqlite3_close_v2(connection);
			connection = nullptr;
			throw Util::BacktraceException<std::runtime_error>(
				std::string("Sqlite3::Db: ") + sql + ": " + msg
			);
		}
	}
	~Impl() {
		if (connection)
			sqlite3_close_v2(connection);
	}

	Ev::Io<Sqlite3::Tx> transact(Db const& db) {
		auto ptx = std::make_shared<Sqlite3::Tx>();
		return Ev::Io< Sqlite3::Tx
			     >([ this, db
			       ]( std::function<void(Sqlite3::Tx)> pass
				, std::function<void(std::exception_ptr)> fail
				) {
			if (in_transaction) {
				blocked.push(Blocked{std::move(pass), std::move(fail)});
				return;
			}
			in_transaction = true;
			auto tx = Sqlite3::Tx();
			try {
				tx = Sqlite3::Tx(db);
			} catch (...) {
				in_transaction = false;
				fail(std::current_exception());
				return;
			}
			pass(std::move(tx));
		}).then([ptx](Sqlite3::Tx tx) {
			/* Resume the new owner outside of whatever
			 * destructor released the previous tx.  */
			*ptx = std::move(tx);
			return Ev::yield();
		}).then([ptx]() {
			return Ev::lift(std::move(*ptx));
		});
	}
	void* get_connection() const { return connection; }
	void transaction_finish(Db const& db) {
		while (!blocked.empty()) {
			auto next = std::move(blocked.front());
			blocked.pop();
			auto tx = Sqlite3::Tx();
			try {
				tx = Sqlite3::Tx(db);
			} catch (...) {
				next.fail(std::current_exception());
				continue;
			}
			next.pass(std::move(tx));
			return;
		}
		in_transaction = false;
	}
};

void* Db::get_connection() const {
	return pimpl->get_connection();
}
void Db::transaction_finish() {
	return pimpl->transaction_finish(*this);
}
Ev::Io<Sqlite3::Tx> Db::transact() {
	return pimpl->transact(*this);
}

Db::Db( std::string const& filename
      ) : pimpl(std::make_shared<Impl>(filename)) { }

}
