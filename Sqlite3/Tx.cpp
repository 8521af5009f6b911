#include"Sqlite3/Db.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Tx.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/make_unique.hpp"
#include<stdexcept>
#include<sqlite3.h>

namespace Sqlite3 {

class Tx::Impl {
private:
	Sqlite3::Db db;
	bool finished;

	sqlite3* connection() const {
		return (sqlite3*) db.get_connection();
	}

	void throw_sqlite3(char const* src) {
		auto err = std::string(sqlite3_errmsg(connection()));
		throw Util::BacktraceException<std::runtime_error>(
			std::string("Sqlite3::Tx: ") + src + ": " + err
		);
	}

public:
	Impl(Sqlite3::Db const& db_) : db(db_), finished(false) {
		auto res = sqlite3_exec( connection(), "BEGIN IMMEDIATE"
				       , NULL, NULL, NULL
				       );
		if (res != SQLITE_OK)
			throw_sqlite3("BEGIN IMMEDIATE");
	}

	void commit() {
		auto res = sqlite3_exec(connection(), "COMMIT", NULL, NULL, NULL);
		if (res != SQLITE_OK)
			throw_sqlite3("COMMIT");
		finished = true;
	}

	~Impl() {
		if (!finished)
			/* Nothing useful can be done on failure here.  */
			(void) sqlite3_exec( connection(), "ROLLBACK"
					   , NULL, NULL, NULL
					   );
		db.transaction_finish();
	}

	void query_execute(char const* q) {
		auto res = sqlite3_exec(connection(), q, NULL, NULL, NULL);
		if (res != SQLITE_OK)
			throw_sqlite3(q);
	}

	Query query(char const* sql) {
		auto stmt = (sqlite3_stmt*) nullptr;
		auto res = sqlite3_prepare_v2( connection(), sql, -1
					     , &stmt, nullptr
					     );
		if (res != SQLITE_OK)
			throw_sqlite3(sql);

		return Query(db, stmt);
	}

	std::int64_t changes() const {
		return sqlite3_changes(connection());
	}
};

Tx::Tx(Sqlite3::Db const& db)
		: pimpl(Util::make_unique<Impl>(db)) { }
Tx::Tx() : pimpl(nullptr) { }
Tx::Tx(Tx&& o) : pimpl(std::move(o.pimpl)) { }
Tx::~Tx() { }

Tx& Tx::operator=(Tx&& o) {
	auto tmp = std::move(o);
	std::swap(pimpl, tmp.pimpl);
	return *this;
}

void Tx::commit() {
	pimpl->commit();
	pimpl = nullptr;
}
void Tx::rollback() {
	pimpl = nullptr;
}

Query Tx::query(char const* sql) {
	return pimpl->query(sql);
}
Query Tx::query(std::string const& q) {
	return query(q.c_str());
}

void Tx::query_execute(char const* q) {
	return pimpl->query_execute(q);
}

std::int64_t Tx::changes() const {
	return pimpl->changes();
}

}
