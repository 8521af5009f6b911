#undef NDEBUG
#include"Sqlite3.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include<assert.h>
#include<cstdint>
#include<memory>
#include<stdexcept>
#include<string>
#include<utility>

namespace {

std::uint64_t balance_of(Sqlite3::Tx& tx, char const* pay_id) {
	auto res = tx.query(R"QRY(
	SELECT total_paid_msat FROM "tips" WHERE pay_id = :pay_id;
	)QRY")
		.bind(":pay_id", pay_id)
		.execute()
		;
	auto rv = std::uint64_t(0);
	auto found = false;
	for (auto& r : res) {
		assert(!found);
		found = true;
		rv = r.get<std::uint64_t>(0);
	}
	assert(found);
	return rv;
}

}

int main() {
	auto db = Sqlite3::Db(":memory:");
	auto order = std::make_shared<std::string>();

	auto credit = [&](char const* tag, std::uint64_t amount) {
		return db.transact().then([&, tag, amount](Sqlite3::Tx tx) {
			tx.query(R"QRY(
			UPDATE "tips"
			   SET total_paid_msat = total_paid_msat + :amount
			 WHERE pay_id = 'p1';
			)QRY")
				.bind(":amount", amount)
				.execute()
				;
			*order += tag;
			auto ptx = std::make_shared<Sqlite3::Tx>(std::move(tx));
			/* Give the other transactions a chance to barge in.  */
			return Ev::yield().then([ptx]() {
				ptx->commit();
				return Ev::lift();
			});
		});
	};

	auto code = Ev::lift().then([&]() {

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(tx);
		tx.commit();
		assert(!tx);

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(tx);
		tx.rollback();
		assert(!tx);

		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tx.query_execute(R"QRY(
		CREATE TABLE "tips"
		     ( pay_id TEXT PRIMARY KEY
		     , lightning_address TEXT NOT NULL
		     , total_paid_msat INTEGER NOT NULL
		     , last_funded_at REAL
		     , active INTEGER NOT NULL
		     );
		)QRY");
		tx.query(R"QRY(
		INSERT INTO "tips"
		VALUES(:pay_id, :address, :amount, :funded, :active);
		)QRY")
			.bind(":pay_id", std::string("p1"))
			.bind(":address", "alice@example.com")
			.bind(":amount", std::uint64_t(0))
			.bind(":funded", nullptr)
			.bind(":active", true)
			.execute()
			;
		assert(tx.changes() == 1);
		tx.commit();

		/* Dropping an uncommitted transaction loses its writes.  */
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tx.query("DELETE FROM \"tips\";").execute();
		assert(tx.changes() == 1);
		return Ev::lift();
	}).then([&]() {
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto res = tx.query(R"QRY(
		SELECT lightning_address, total_paid_msat, last_funded_at, active
		  FROM "tips";
		)QRY")
			.execute()
			;
		auto count = 0;
		for (auto& r : res) {
			++count;
			assert(r.get<std::string>(0) == "alice@example.com");
			assert(r.get<std::uint64_t>(1) == 0);
			assert(r.is_null(2));
			assert(!r.is_null(3));
			assert(r.get<bool>(3));
		}
		assert(count == 1);

		/* An exception in the middle of a transaction rolls it
		 * back too.  */
		tx.commit();
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		tx.query(R"QRY(
		UPDATE "tips" SET active = 0 WHERE pay_id = 'p1';
		)QRY").execute();
		throw std::runtime_error("deactivation abandoned");
		return Ev::lift(false);
	}).catching<std::runtime_error>([&](std::runtime_error const& e) {
		return Ev::lift(true);
	}).then([&](bool caught) {
		assert(caught);
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		auto res = tx.query("SELECT active FROM \"tips\";").execute();
		for (auto& r : res)
			assert(r.get<bool>(0));

		/* A named parameter can appear more than once.  */
		auto res2 = tx.query(R"QRY(
		UPDATE "tips"
		   SET last_funded_at = :now
		 WHERE last_funded_at IS NULL
		    OR last_funded_at < :now;
		)QRY")
			.bind(":now", 1000.5)
			.execute()
			;
		(void) res2;
		assert(tx.changes() == 1);
		auto res3 = tx.query(R"QRY(
		SELECT last_funded_at FROM "tips";
		)QRY").execute();
		for (auto& r : res3)
			assert(r.get<double>(0) == 1000.5);
		tx.commit();

		/* Concurrent transactions are serialized: each sees the
		 * commit of the previous one.  */
		return Ev::concurrent(credit("a", 1000));
	}).then([&]() {
		return Ev::concurrent(credit("b", 2000));
	}).then([&]() {
		return credit("c", 3000);
	}).then([&]() {
		return Ev::yield();
	}).then([&]() {
		return db.transact();
	}).then([&](Sqlite3::Tx tx) {
		assert(balance_of(tx, "p1") == 6000);
		assert(order->size() == 3);
		tx.commit();

		return Ev::lift(0);
	});

	return Ev::start(code);
}
