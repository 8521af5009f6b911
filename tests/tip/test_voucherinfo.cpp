#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Http/Router.hpp"
#include"Jsmn/Object.hpp"
#include"Lnurl/codec.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Tip/Mod/VoucherInfo.hpp"
#include"Tip/Store.hpp"
#include"Util/date.hpp"
#include<assert.h>
#include<sodium.h>
#include<vector>

namespace {

double mock_now = 1767323045.0;
auto const year = double(365 * 86400);

Http::Request info(std::string const& lightning) {
	auto req = Http::Request();
	req.method = "GET";
	req.path = "/api/vouchers/info";
	req.query["lightning"] = lightning;
	return req;
}

std::string error(Http::Response const& rsp) {
	return std::string(Jsmn::Object::parse_json(rsp.body)["error"]);
}

}

int main() {
	assert(sodium_init() >= 0);

	typedef Tip::Mod::VoucherInfo VI;
	{
		auto s = VI::path_segments("https://tip.example/pay/abc?x=1#top");
		assert(s.size() == 2);
		assert(s[0] == "pay");
		assert(s[1] == "abc");
		s = VI::path_segments("http://h:8080//withdraw//def/");
		assert(s.size() == 2);
		assert(s[0] == "withdraw");
		assert(s[1] == "def");
		assert(VI::path_segments("https://tip.example").empty());
		assert(VI::path_segments("https://tip.example/").empty());
	}

	auto bus = S::Bus();
	Http::Router router;
	auto db = Sqlite3::Db(":memory:");
	auto store = Tip::Store(db, year, []() { return mock_now; });

	/* Module under test.  */
	VI mut(bus, router, store);

	auto v = Tip::Voucher();
	auto pay = std::string();
	auto withdraw = std::string();

	auto code = Ev::lift().then([&]() {
		return store.init();
	}).then([&]() {
		return store.create_batch("", "alice@example.com", 1, 3600);
	}).then([&](std::vector<Tip::Voucher> batch) {
		v = batch[0];
		pay = Lnurl::encode("https://tip.example/pay/" + std::string(v.pay_id));
		withdraw = Lnurl::encode("https://tip.example/withdraw/" + std::string(v.withdraw_id));

		auto inv = Tip::PayInvoice();
		inv.id = Uuid::random();
		inv.pay_id = v.pay_id;
		inv.payment_hash = "h1";
		inv.amount = Ln::Amount::msat(50000);
		inv.credited = Ln::Amount::msat(48000);
		return store.add_pay_invoice(inv);
	}).then([&]() {
		mock_now += 100;
		return store.credit_if_active(v.pay_id, Ln::Amount::msat(48000), "h1");
	}).then([&](bool ok) {
		assert(ok);
		mock_now += 0.5;
		return router.dispatch(info(pay));
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 200);
		auto js = Jsmn::Object::parse_json(rsp.body);
		assert(std::string(js["kind"]) == "pay");
		assert(double(js["balance_msats"]) == 48000);
		assert(double(js["balance_sats"]) == 48);
		assert(bool(js["active"]));
		/* Funded 0.5 seconds ago with an hour to go.  */
		assert(double(js["expires_in_seconds"]) == 3599);
		assert(std::string(js["lightning_address"]) == "alice@example.com");
		auto funding = js["funding"];
		assert(funding.size() == 1);
		assert(double(funding[0]["credited_msats"]) == 48000);
		assert( std::string(funding[0]["paid_at"])
		     == Util::rfc3339(mock_now - 0.5)
		      );

		/* Lowercase works too, and the withdraw side
		 * has no funding history.  */
		auto lower = withdraw;
		for (auto& c : lower)
			c = char(tolower(c));
		return router.dispatch(info(lower));
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 200);
		auto js = Jsmn::Object::parse_json(rsp.body);
		assert(std::string(js["kind"]) == "withdraw");
		assert(double(js["balance_msats"]) == 48000);
		assert(!js.has("funding"));

		/* Past the relative expiry.  */
		mock_now += 3600;
		return router.dispatch(info(pay));
	}).then([&](Http::Response rsp) {
		auto js = Jsmn::Object::parse_json(rsp.body);
		assert(!bool(js["active"]));
		assert(!js.has("expires_in_seconds"));

		/* Errors.  */
		return router.dispatch(info(""));
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 400);
		assert(error(rsp) == "missing lightning parameter");
		return router.dispatch(info("LNURL1GARBAGE"));
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 400);
		assert(error(rsp).substr(0, 13) == "invalid LNURL");
		/* Non-ASCII bytes from the query string.  */
		return router.dispatch(info("LNURL1\xc3\xa9\xff\x80QQQQQQ"));
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 400);
		assert(error(rsp).substr(0, 13) == "invalid LNURL");
		return router.dispatch(info(Lnurl::encode("https://tip.example/other/x")));
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 400);
		assert(error(rsp) == "not a voucher LNURL");
		return router.dispatch(info(Lnurl::encode("https://tip.example/pay")));
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 400);
		return router.dispatch(info(Lnurl::encode(
			"https://tip.example/pay/00112233445566778899aabbccddeeff"
		)));
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 404);
		assert(error(rsp) == "voucher not found");
		return router.dispatch(info(Lnurl::encode("https://tip.example/pay/zz")));
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 404);

		return Ev::lift(0);
	});

	return Ev::start(code);
}
