#ifndef SQLITE3_TX_HPP
#define SQLITE3_TX_HPP

#include<cstdint>
#include<memory>
#include<string>

namespace Sqlite3 { class Db; }
namespace Sqlite3 { class Query; }

namespace Sqlite3 {

/** class Sqlite3::Tx
 *
 * @brief Represents an ongoing database transaction.
 * Writes will only be committed when the tx is
 * committed.
 *
 * @desc This object is movable but not copyable.
 * When the object is still valid when destructed, it
 * rolls back all updates; `commit()` must be called
 * explicitly.
 * This makes an exception thrown in the middle of a
 * check-then-act sequence leave the database as it
 * was.
 *
 * This has a default constructor which creates an
 * unusable, invalid transaction.
 * The proper way of constructing an `Sqlite3::Tx`
 * is by the `Sqlite3::Db::transact` function.
 */
class Tx {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	friend class Sqlite3::Db;

	explicit
	Tx(Sqlite3::Db const&);

public:
	/* Can be default-constructed and moved.  */
	Tx();
	Tx(Tx&&);
	~Tx();

	Tx& operator=(Tx&&);

	/* Check for validity.  */
	operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	Sqlite3::Query query(char const*);
	Sqlite3::Query query(std::string const&);

	/** Sqlite3::Tx::query_execute
	 *
	 * @brief Executes a query.
	 *
	 * @desc There is no opportunity to bind parameters
	 * or check results.
	 * This is primarily intended for e.g. table creation
	 * commands.
	 */
	void query_execute(char const*);
	void query_execute(std::string const& q) {
		query_execute(q.c_str());
	}

	/** Sqlite3::Tx::changes
	 *
	 * @brief number of rows modified by the most
	 * recently completed INSERT, UPDATE or DELETE.
	 */
	std::int64_t changes() const;

	/* Commit and rollback.
	 * Pre-condition: the transaction is valid.
	 * Post-condition: the transaction will be invalid.
	 * If commit throws, the transaction stays valid
	 * and is rolled back on destruction.
	 */
	void commit();
	void rollback();
};

}

#endif /* !defined(SQLITE3_TX_HPP) */
