#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Gateway/GatewayIF.hpp"
#include"Http/ClientIF.hpp"
#include"Lnurl/Resolver.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Tip/Mod/RefundJob.hpp"
#include"Tip/Mod/TaskRunner.hpp"
#include"Tip/Mod/Waiter.hpp"
#include"Tip/Msg/TimerRefund.hpp"
#include"Tip/Refunder.hpp"
#include"Tip/Shutdown.hpp"
#include"Tip/Store.hpp"
#include<assert.h>
#include<sodium.h>
#include<string>
#include<vector>

namespace {

double mock_now = 1000.0;

class FakeGateway : public Gateway::GatewayIF {
public:
	std::vector<std::string> payments;

	Ev::Io<Gateway::Invoice> create_invoice( Ln::Amount amount
					       , std::string const& description
					       ) override {
		throw std::logic_error("not used");
	}
	Ev::Io<bool> wait_for_payment( std::string const& payment_hash
				     , double timeout
				     ) override {
		throw std::logic_error("not used");
	}
	Ev::Io<Gateway::PayResult> pay_invoice(std::string const& bolt11) override {
		payments.push_back(bolt11);
		if (bolt11 == "lnbc-carol")
			return Ev::lift(Gateway::PayResult{
				Gateway::PayResult::Ambiguous, "timed out"
			});
		return Ev::lift(Gateway::PayResult{Gateway::PayResult::Success, ""});
	}
};

/* example.com knows alice, carol and dave;
 * broken.example is down until `fixed`.  */
class FakeClient : public Http::ClientIF {
public:
	bool fixed;
	std::vector<std::string> callbacks;

	FakeClient() : fixed(false) { }

	Ev::Io<Http::ClientResponse> request(Http::ClientRequest req) override {
		auto const wk = std::string("https://example.com/.well-known/lnurlp/");
		auto const cb = std::string("https://example.com/cb/");
		if (req.url == "https://broken.example/.well-known/lnurlp/bob") {
			if (!fixed)
				return Ev::lift(Http::ClientResponse{404, "not found"});
			return Ev::lift(Http::ClientResponse{200, R"JSON(
			{ "callback": "https://example.com/cb/bob"
			, "minSendable": 1000
			, "maxSendable": 100000000
			}
			)JSON"});
		}
		if (req.url.compare(0, wk.size(), wk) == 0) {
			auto user = req.url.substr(wk.size());
			auto min = (user == "dave") ? "100000" : "1000";
			return Ev::lift(Http::ClientResponse{200,
				std::string("{\"callback\": \"") + cb + user + "\""
				", \"minSendable\": " + min +
				", \"maxSendable\": 100000000}"
			});
		}
		if (req.url.compare(0, cb.size(), cb) == 0) {
			callbacks.push_back(req.url);
			auto user = req.url.substr(cb.size());
			user = user.substr(0, user.find('?'));
			return Ev::lift(Http::ClientResponse{200,
				"{\"pr\": \"lnbc-" + user + "\"}"
			});
		}
		return Ev::lift(Http::ClientResponse{404, "not found"});
	}
};

Ev::Io<void> drain(Tip::Mod::TaskRunner& runner) {
	return Ev::yield().then([&runner]() {
		if (runner.running() == 0)
			return Ev::lift();
		return drain(runner);
	});
}

}

int main() {
	assert(sodium_init() >= 0);

	auto bus = S::Bus();
	Tip::Mod::Waiter waiter(bus);
	Tip::Mod::TaskRunner runner(bus, waiter);
	auto db = Sqlite3::Db(":memory:");
	auto store = Tip::Store(db, 365 * 86400.0, []() {
		return mock_now;
	});
	FakeGateway gateway;
	FakeClient client;
	Lnurl::Resolver resolver(client);
	Tip::Refunder refunder(bus, resolver, gateway);

	/* Module under test.  */
	Tip::Mod::RefundJob mut(bus, store, refunder, runner, 3600);

	/* alice: refunded.
	 * bob: cannot be resolved, so retried.
	 * carol: unknown outcome, never retried.
	 * dave: dust, so nothing is paid.
	 * erin: not yet expired.  */
	auto owners = std::vector<std::string>{
		"alice@example.com", "bob@broken.example", "carol@example.com",
		"dave@example.com", "erin@example.com"
	};
	auto ids = std::vector<Uuid>();
	auto voucher = [&](std::size_t i) {
		return store.get_by_pay_id(ids[i]);
	};

	auto make = std::function<Ev::Io<void>(std::size_t)>();
	make = [&](std::size_t i) {
		if (i == owners.size())
			return Ev::lift();
		auto expiry = (i == 4) ? 86400.0 : 60.0;
		auto amount = Ln::Amount::msat(i == 3 ? 500 : 48999);
		auto hash = "h" + std::to_string(i);
		return store.create_batch("", owners[i], 1, expiry)
			.then([&, amount, hash](std::vector<Tip::Voucher> b) {
			ids.push_back(b[0].pay_id);
			auto inv = Tip::PayInvoice();
			inv.id = Uuid::random();
			inv.pay_id = b[0].pay_id;
			inv.payment_hash = hash;
			inv.amount = amount;
			inv.credited = amount;
			return store.add_pay_invoice(inv);
		}).then([&, amount, hash]() {
			return store.credit_if_active(ids.back(), amount, hash);
		}).then([&, i](bool ok) {
			assert(ok);
			return make(i + 1);
		});
	};

	auto code = Ev::lift().then([&]() {
		return store.init();
	}).then([&]() {
		return make(0);
	}).then([&]() {
		/* Nothing has expired.  */
		return mut.sweep();
	}).then([&]() {
		assert(gateway.payments.empty());
		assert(client.callbacks.empty());

		mock_now += 61;
		return mut.sweep();
	}).then([&]() {
		assert(gateway.payments.size() == 2);
		assert(gateway.payments[0] == "lnbc-alice" || gateway.payments[1] == "lnbc-alice");
		assert(gateway.payments[0] == "lnbc-carol" || gateway.payments[1] == "lnbc-carol");
		/* Rounded down to whole satoshis.  */
		for (auto const& cb : client.callbacks)
			assert(cb.substr(cb.find('?')) == "?amount=48000");
		return voucher(0);
	}).then([&](std::shared_ptr<Tip::Voucher> v) {
		assert(!v->active);
		assert(v->total_paid == Ln::Amount::msat(0));
		return voucher(1);
	}).then([&](std::shared_ptr<Tip::Voucher> v) {
		/* Definite failure: balance restored.  */
		assert(v->active);
		assert(v->total_paid == Ln::Amount::msat(48999));
		return voucher(2);
	}).then([&](std::shared_ptr<Tip::Voucher> v) {
		assert(!v->active);
		assert(v->total_paid == Ln::Amount::msat(0));
		return voucher(3);
	}).then([&](std::shared_ptr<Tip::Voucher> v) {
		assert(v->active);
		assert(v->total_paid == Ln::Amount::msat(500));
		return voucher(4);
	}).then([&](std::shared_ptr<Tip::Voucher> v) {
		assert(v->active);
		assert(v->total_paid == Ln::Amount::msat(48999));

		/* Running again right away pays nobody twice.  */
		return mut.sweep();
	}).then([&]() {
		assert(gateway.payments.size() == 2);

		/* The periodic trigger retries bob once his
		 * domain is back.  */
		client.fixed = true;
		return bus.raise(Tip::Msg::TimerRefund());
	}).then([&]() {
		return drain(runner);
	}).then([&]() {
		assert(gateway.payments.size() == 3);
		assert(gateway.payments[2] == "lnbc-bob");
		return voucher(1);
	}).then([&](std::shared_ptr<Tip::Voucher> v) {
		assert(!v->active);
		assert(v->total_paid == Ln::Amount::msat(0));
		return store.find_expired_funded_vouchers();
	}).then([&](std::vector<Tip::Voucher> expired) {
		/* Only dust is left.  */
		assert(expired.size() == 1);
		assert(expired[0].pay_id == ids[3]);

		return bus.raise(Tip::Shutdown());
	}).then([]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
