#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Gateway/GatewayIF.hpp"
#include"Http/ClientIF.hpp"
#include"Lnurl/Resolver.hpp"
#include"S/Bus.hpp"
#include"Tip/Msg/Log.hpp"
#include"Tip/Refunder.hpp"
#include<assert.h>
#include<vector>

namespace {

class FakeGateway : public Gateway::GatewayIF {
public:
	Gateway::PayResult::Outcome outcome;
	std::vector<std::string> payments;

	FakeGateway() : outcome(Gateway::PayResult::Success) { }

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
		return Ev::lift(Gateway::PayResult{outcome, "gateway says"});
	}
};

class FakeClient : public Http::ClientIF {
public:
	std::string params;
	std::string invoice;
	std::vector<std::string> urls;

	Ev::Io<Http::ClientResponse> request(Http::ClientRequest req) override {
		urls.push_back(req.url);
		if (req.url.find("/.well-known/lnurlp/") != std::string::npos)
			return Ev::lift(Http::ClientResponse{200, params});
		return Ev::lift(Http::ClientResponse{200, invoice});
	}
};

auto const good_params = std::string(R"JSON(
{ "tag": "payRequest"
, "callback": "https://wallet.example/cb?user=me"
, "minSendable": 100000
, "maxSendable": 5000000
, "metadata": "[]"
}
)JSON");

}

int main() {
	/* Bounds.  */
	{
		auto min = Ln::Amount::msat(100000);
		auto max = Ln::Amount::msat(5000000);
		assert(Tip::Refunder::refund_amount(Ln::Amount::msat(500), min, max)
		    == Ln::Amount::msat(0));
		assert(Tip::Refunder::refund_amount(Ln::Amount::msat(99999), min, max)
		    == Ln::Amount::msat(0));
		assert(Tip::Refunder::refund_amount(Ln::Amount::msat(100000), min, max)
		    == Ln::Amount::msat(100000));
		assert(Tip::Refunder::refund_amount(Ln::Amount::msat(123456), min, max)
		    == Ln::Amount::msat(123000));
		assert(Tip::Refunder::refund_amount(Ln::Amount::msat(9000000), min, max)
		    == max);
		/* Below a satoshi rounds to nothing.  */
		assert(Tip::Refunder::refund_amount( Ln::Amount::msat(999)
						   , Ln::Amount::msat(1)
						   , max
						   ) == Ln::Amount::msat(0));
	}

	auto bus = S::Bus();
	auto warnings = std::vector<std::string>();
	bus.subscribe<Tip::Msg::Log>([&](Tip::Msg::Log const& l) {
		if (l.level == Tip::Warn)
			warnings.push_back(l.message);
		return Ev::lift();
	});
	FakeGateway gateway;
	FakeClient client;
	Lnurl::Resolver resolver(client);
	Tip::Refunder mut(bus, resolver, gateway);

	client.params = good_params;
	client.invoice = R"JSON({"pr": "lnbc1refund", "routes": []})JSON";

	auto code = Ev::lift().then([&]() {
		/* Dust: no invoice, no payment.  */
		return mut.refund("me@wallet.example", Ln::Amount::msat(500));
	}).then([&](Gateway::PayResult res) {
		assert(res.outcome == Gateway::PayResult::Failed);
		assert(res.detail.find("dust") != std::string::npos);
		assert(gateway.payments.empty());
		assert(warnings.empty());
		assert(client.urls.size() == 1);
		assert(client.urls[0] == "https://wallet.example/.well-known/lnurlp/me");

		/* Capped to the receiver's maximum.  */
		return mut.refund("me@wallet.example", Ln::Amount::msat(7000000));
	}).then([&](Gateway::PayResult res) {
		assert(res.outcome == Gateway::PayResult::Success);
		assert(client.urls.size() == 3);
		assert(client.urls[2] == "https://wallet.example/cb?user=me&amount=5000000");
		assert(gateway.payments.size() == 1);
		assert(gateway.payments[0] == "lnbc1refund");
		/* The excess is forfeited, loudly.  */
		assert(warnings.size() == 1);
		assert(warnings[0].find("me@wallet.example") != std::string::npos);
		assert(warnings[0].find("forfeiting 2000000msat") != std::string::npos);

		/* The gateway's outcome is passed on.  */
		gateway.outcome = Gateway::PayResult::Ambiguous;
		return mut.refund("me@wallet.example", Ln::Amount::msat(150500));
	}).then([&](Gateway::PayResult res) {
		assert(res.outcome == Gateway::PayResult::Ambiguous);
		assert(client.urls.back() == "https://wallet.example/cb?user=me&amount=150000");
		gateway.outcome = Gateway::PayResult::Failed;
		return mut.refund("me@wallet.example", Ln::Amount::msat(150500));
	}).then([&](Gateway::PayResult res) {
		assert(res.outcome == Gateway::PayResult::Failed);
		assert(gateway.payments.size() == 3);
		/* Rounding alone is not a cap.  */
		assert(warnings.size() == 1);

		/* A malformed address never reaches the network.  */
		client.urls.clear();
		return mut.refund("not an address", Ln::Amount::msat(150500));
	}).then([&](Gateway::PayResult res) {
		assert(res.outcome == Gateway::PayResult::Failed);
		assert(client.urls.empty());

		/* The receiver refuses to make an invoice.  */
		client.invoice = R"JSON({"status": "ERROR", "reason": "no"})JSON";
		return mut.refund("me@wallet.example", Ln::Amount::msat(150500));
	}).then([&](Gateway::PayResult res) {
		assert(res.outcome == Gateway::PayResult::Failed);
		assert(res.detail.find("no") != std::string::npos);

		/* Unusable parameters.  */
		client.params = R"JSON({"callback": "", "minSendable": 1, "maxSendable": 2})JSON";
		return mut.refund("me@wallet.example", Ln::Amount::msat(150500));
	}).then([&](Gateway::PayResult res) {
		assert(res.outcome == Gateway::PayResult::Failed);
		client.params = "<html>";
		return mut.refund("me@wallet.example", Ln::Amount::msat(150500));
	}).then([&](Gateway::PayResult res) {
		assert(res.outcome == Gateway::PayResult::Failed);
		assert(gateway.payments.size() == 3);
		/* Rounding alone is not a cap.  */
		assert(warnings.size() == 1);

		return Ev::lift(0);
	});

	return Ev::start(code);
}
