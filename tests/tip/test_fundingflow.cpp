#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Gateway/GatewayIF.hpp"
#include"Http/ClientIF.hpp"
#include"Http/Router.hpp"
#include"Jsmn/Object.hpp"
#include"Lnurl/codec.hpp"
#include"Lnurl/Resolver.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Tip/Config.hpp"
#include"Tip/Mod/FundingFlow.hpp"
#include"Tip/Mod/TaskRunner.hpp"
#include"Tip/Mod/Waiter.hpp"
#include"Tip/Refunder.hpp"
#include"Tip/Shutdown.hpp"
#include"Tip/Store.hpp"
#include<assert.h>
#include<map>
#include<sodium.h>
#include<vector>

namespace {

double mock_now = 1000.0;

class FakeGateway : public Gateway::GatewayIF {
public:
	std::size_t invoices;
	std::vector<Ln::Amount> amounts;
	bool paid;
	/* While set, payments stay unconfirmed.  */
	bool hold;
	std::vector<std::string> payments;

	FakeGateway() : invoices(0), paid(true), hold(false) { }

	Ev::Io<bool> confirmation() {
		return Ev::yield().then([this]() {
			if (hold)
				return confirmation();
			return Ev::lift(paid);
		});
	}

	Ev::Io<Gateway::Invoice> create_invoice( Ln::Amount amount
					       , std::string const& description
					       ) override {
		++invoices;
		amounts.push_back(amount);
		auto inv = Gateway::Invoice();
		inv.payment_hash = "hash" + std::to_string(invoices);
		inv.invoice = "lnbc" + std::to_string(invoices);
		return Ev::lift(inv);
	}
	Ev::Io<bool> wait_for_payment( std::string const& payment_hash
				     , double timeout
				     ) override {
		return confirmation();
	}
	Ev::Io<Gateway::PayResult> pay_invoice(std::string const& bolt11) override {
		payments.push_back(bolt11);
		return Ev::lift(Gateway::PayResult{Gateway::PayResult::Success, ""});
	}
};

/* Serves the lightning address of the voucher owner.  */
class FakeClient : public Http::ClientIF {
public:
	std::vector<std::string> urls;

	Ev::Io<Http::ClientResponse> request(Http::ClientRequest req) override {
		urls.push_back(req.url);
		if (req.url == "https://example.com/.well-known/lnurlp/alice")
			return Ev::lift(Http::ClientResponse{200, R"JSON(
			{ "tag": "payRequest"
			, "callback": "https://example.com/cb"
			, "minSendable": 1000
			, "maxSendable": 100000000
			}
			)JSON"});
		return Ev::lift(Http::ClientResponse{200, R"JSON(
		{"pr": "lnbcrefund", "routes": []}
		)JSON"});
	}
};

Ev::Io<void> drain(Tip::Mod::TaskRunner& runner) {
	return Ev::yield().then([&runner]() {
		if (runner.running() == 0)
			return Ev::lift();
		return drain(runner);
	});
}

Http::Request get( std::string const& path
		 , std::map<std::string, std::string> query = {}
		 ) {
	auto req = Http::Request();
	req.method = "GET";
	req.path = path;
	req.query = std::move(query);
	return req;
}

std::string reason(Jsmn::Object const& js) {
	assert(std::string(js["status"]) == "ERROR");
	return std::string(js["reason"]);
}

}

int main() {
	assert(sodium_init() >= 0);

	auto bus = S::Bus();
	Tip::Mod::Waiter waiter(bus);
	Tip::Mod::TaskRunner runner(bus, waiter);
	Http::Router router;
	auto config = Tip::Config();
	config.base_url = "https://tip.example";
	auto db = Sqlite3::Db(":memory:");
	auto store = Tip::Store(db, config.absolute_expiry, []() {
		return mock_now;
	});
	FakeGateway gateway;
	FakeClient client;
	Lnurl::Resolver resolver(client);
	Tip::Refunder refunder(bus, resolver, gateway);

	/* Module under test.  */
	Tip::Mod::FundingFlow mut( bus, router, store, gateway
				 , refunder, runner, config
				 );

	auto pay_id = std::string();
	auto js = Jsmn::Object();

	auto code = Ev::lift().then([&]() {
		return store.init();
	}).then([&]() {
		return store.create_batch("", "alice@example.com", 1, 86400);
	}).then([&](std::vector<Tip::Voucher> batch) {
		pay_id = std::string(batch[0].pay_id);
		return router.dispatch(get("/pay/" + pay_id));
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 200);
		js = Jsmn::Object::parse_json(rsp.body);
		assert(std::string(js["tag"]) == "payRequest");
		assert( std::string(js["callback"])
		     == "https://tip.example/pay/" + pay_id + "/callback"
		      );
		assert(double(js["minSendable"]) == 100000);
		assert(double(js["maxSendable"]) == 200000000);
		assert( std::string(js["metadata"])
		     == "[[\"text/plain\", \"Tip via TipMe\"]]"
		      );
		/* Links back to the voucher's info view.  */
		auto url = std::string(js["url"]);
		auto const info = std::string("https://tip.example/api/vouchers/info?lightning=");
		assert(url.substr(0, info.size()) == info);
		assert( Lnurl::decode(url.substr(info.size()))
		     == "https://tip.example/pay/" + pay_id
		      );

		/* Unknown voucher.  */
		return router.dispatch(get("/pay/00112233445566778899aabbccddeeff"));
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 200);
		assert(reason(Jsmn::Object::parse_json(rsp.body)) == "voucher not found");
		return router.dispatch(get("/pay/not-a-uuid"));
	}).then([&](Http::Response rsp) {
		assert(reason(Jsmn::Object::parse_json(rsp.body)) == "voucher not found");

		/* Bad amounts.  */
		return router.dispatch(get("/pay/" + pay_id + "/callback"));
	}).then([&](Http::Response rsp) {
		assert(reason(Jsmn::Object::parse_json(rsp.body)) == "missing amount parameter");
		return router.dispatch(get( "/pay/" + pay_id + "/callback"
					  , {{"amount", "12x"}}
					  ));
	}).then([&](Http::Response rsp) {
		assert(reason(Jsmn::Object::parse_json(rsp.body)) == "invalid amount");
		return router.dispatch(get( "/pay/" + pay_id + "/callback"
					  , {{"amount", "0"}}
					  ));
	}).then([&](Http::Response rsp) {
		assert(reason(Jsmn::Object::parse_json(rsp.body)) == "invalid amount");
		/* Exactly the minimum fee leaves nothing.  */
		return router.dispatch(get( "/pay/" + pay_id + "/callback"
					  , {{"amount", "2000"}}
					  ));
	}).then([&](Http::Response rsp) {
		assert( reason(Jsmn::Object::parse_json(rsp.body))
		     == "amount too small to cover fee"
		      );
		assert(gateway.invoices == 0);

		/* 50000msat, less the 2000msat minimum fee.  */
		return router.dispatch(get( "/pay/" + pay_id + "/callback"
					  , {{"amount", "50000"}}
					  ));
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 200);
		js = Jsmn::Object::parse_json(rsp.body);
		assert(std::string(js["pr"]) == "lnbc1");
		assert(js["routes"].is_array());
		assert(js["routes"].size() == 0);
		assert(gateway.invoices == 1);
		/* The gross amount is invoiced.  */
		assert(gateway.amounts[0] == Ln::Amount::msat(50000));
		return drain(runner);
	}).then([&]() {
		return store.get_by_pay_id(Uuid(pay_id));
	}).then([&](std::shared_ptr<Tip::Voucher> v) {
		assert(v->total_paid == Ln::Amount::msat(48000));
		assert(v->funded);
		assert(v->last_funded_at == mock_now);
		return store.get_paid_invoices(Uuid(pay_id));
	}).then([&](std::vector<Tip::PayInvoice> paid) {
		assert(paid.size() == 1);
		assert(paid[0].payment_hash == "hash1");
		assert(paid[0].amount == Ln::Amount::msat(50000));
		assert(paid[0].credited == Ln::Amount::msat(48000));

		/* An unpaid invoice credits nothing.  */
		gateway.paid = false;
		return router.dispatch(get( "/pay/" + pay_id + "/callback"
					  , {{"amount", "10000"}}
					  ));
	}).then([&](Http::Response rsp) {
		assert(std::string(Jsmn::Object::parse_json(rsp.body)["pr"]) == "lnbc2");
		return drain(runner);
	}).then([&]() {
		return store.get_by_pay_id(Uuid(pay_id));
	}).then([&](std::shared_ptr<Tip::Voucher> v) {
		assert(v->total_paid == Ln::Amount::msat(48000));

		/* Paid after the voucher was withdrawn:
		 * the credited amount goes back to the owner.  */
		gateway.paid = true;
		gateway.hold = true;
		return router.dispatch(get( "/pay/" + pay_id + "/callback"
					  , {{"amount", "100000"}}
					  ));
	}).then([&](Http::Response rsp) {
		assert(std::string(Jsmn::Object::parse_json(rsp.body)["pr"]) == "lnbc3");
		return store.deactivate_for_withdrawal(Uuid(pay_id));
	}).then([&]() {
		gateway.hold = false;
		return drain(runner);
	}).then([&]() {
		return store.get_by_pay_id(Uuid(pay_id));
	}).then([&](std::shared_ptr<Tip::Voucher> v) {
		assert(!v->active);
		assert(v->total_paid == Ln::Amount::msat(0));
		assert(gateway.payments.size() == 1);
		assert(gateway.payments[0] == "lnbcrefund");
		assert(client.urls.size() == 2);
		assert(client.urls[0] == "https://example.com/.well-known/lnurlp/alice");
		/* 100000 less 2000 fee, rounded down to whole satoshis.  */
		assert(client.urls[1] == "https://example.com/cb?amount=98000");

		/* An inactive voucher takes no more funding.  */
		return router.dispatch(get( "/pay/" + pay_id + "/callback"
					  , {{"amount", "100000"}}
					  ));
	}).then([&](Http::Response rsp) {
		assert(reason(Jsmn::Object::parse_json(rsp.body)) == "voucher is not active");
		return router.dispatch(get("/pay/" + pay_id));
	}).then([&](Http::Response rsp) {
		assert(reason(Jsmn::Object::parse_json(rsp.body)) == "voucher is not active");

		return bus.raise(Tip::Shutdown());
	}).then([]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
