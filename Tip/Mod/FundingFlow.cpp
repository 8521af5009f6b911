#include"Ev/Io.hpp"
#include"Gateway/GatewayIF.hpp"
#include"Http/Router.hpp"
#include"Json/Out.hpp"
#include"Tip/Config.hpp"
#include"Tip/Mod/FundingFlow.hpp"
#include"Tip/Mod/TaskRunner.hpp"
#include"Tip/Refunder.hpp"
#include"Tip/Store.hpp"
#include"Tip/fee.hpp"
#include"Tip/links.hpp"
#include"Tip/log.hpp"
#include<cstdint>
#include<limits>
#include<memory>

namespace {

auto const task_grace = double(120);

/* Thrown to answer with an LNURL error.  */
struct Refuse {
	std::string reason;
};

/* Decimal millisatoshis, greater than zero.  */
bool parse_msat(std::uint64_t& rv, std::string const& s) {
	if (s.empty() || s.size() > 19)
		return false;
	auto v = std::uint64_t(0);
	for (auto c : s) {
		if (c < '0' || c > '9')
			return false;
		v = v * 10 + std::uint64_t(c - '0');
	}
	if (v == 0)
		return false;
	rv = v;
	return true;
}

}

namespace Tip { namespace Mod {

std::string FundingFlow::metadata_string() {
	return Json::Out()
		.start_array()
			.start_array()
				.entry("text/plain")
				.entry("Tip via TipMe")
			.end_array()
		.end_array()
		.output()
		;
}

void FundingFlow::start(Http::Router& router) {
	router.add("GET", "/pay/{pay_id}", [this](Http::Request req) {
		return metadata(std::move(req));
	});
	router.add("GET", "/pay/{pay_id}/callback", [this](Http::Request req) {
		return callback(std::move(req));
	});
}

Ev::Io<Http::Response> FundingFlow::metadata(Http::Request req) {
	auto id = req.param("pay_id");
	if (!Uuid::valid_string(id))
		return Ev::lift(Http::Response::lnurl_error("voucher not found"));
	auto pay_id = Uuid(id);
	return store.get_by_pay_id(pay_id)
		.then([this, pay_id](std::shared_ptr<Voucher> v) {
		if (!v)
			return Ev::lift(Http::Response::lnurl_error(
				"voucher not found"
			));
		if (!v->is_active(store.now(), store.absolute_expiry()))
			return Ev::lift(Http::Response::lnurl_error(
				"voucher is not active"
			));
		auto url = pay_url(config.base_url, pay_id);
		auto out = Json::Out()
			.start_object()
				.field("tag", "payRequest")
				.field("callback", url + "/callback")
				.field("minSendable", config.min_sendable.to_msat())
				.field("maxSendable", config.max_sendable.to_msat())
				.field("metadata", metadata_string())
				.field("url", info_url(config.base_url, url))
			.end_object()
			;
		return Ev::lift(Http::Response::json(200, out));
	}).catching<std::exception>([this](std::exception const& e) {
		return Tip::log( bus, Error
			       , "FundingFlow: metadata: %s", e.what()
			       ).then([]() {
			return Ev::lift(Http::Response::lnurl_error("database error"));
		});
	});
}

Ev::Io<Http::Response> FundingFlow::callback(Http::Request req) {
	auto id = req.param("pay_id");
	if (!req.has_query("amount") || req.query_value("amount").empty())
		return Ev::lift(Http::Response::lnurl_error(
			"missing amount parameter"
		));
	auto msat = std::uint64_t(0);
	if (!parse_msat(msat, req.query_value("amount")))
		return Ev::lift(Http::Response::lnurl_error("invalid amount"));
	if (!Uuid::valid_string(id))
		return Ev::lift(Http::Response::lnurl_error("voucher not found"));

	auto pay_id = Uuid(id);
	auto amount = Ln::Amount::msat(msat);
	auto fee = funding_fee( amount
			      , config.funding_fee_min
			      , config.funding_fee_percent
			      );
	auto credited = amount - fee;

	return store.get_by_pay_id(pay_id)
		.then([this, amount, fee](std::shared_ptr<Voucher> v) {
		if (!v)
			throw Refuse{"voucher not found"};
		if (!v->is_active(store.now(), store.absolute_expiry()))
			throw Refuse{"voucher is not active"};
		if (amount <= fee)
			throw Refuse{"amount too small to cover fee"};
		return gateway.create_invoice(amount, "TipMe voucher funding")
			.catching<std::exception>([this](std::exception const& e) {
			return Tip::log( bus, Error
				       , "FundingFlow: cannot create invoice: %s"
				       , e.what()
				       ).then([]() -> Ev::Io<Gateway::Invoice> {
				throw Refuse{"failed to create invoice"};
			});
		});
	}).then([this, pay_id, amount, credited](Gateway::Invoice inv) {
		auto pinv = PayInvoice();
		pinv.id = Uuid::random();
		pinv.pay_id = pay_id;
		pinv.payment_hash = inv.payment_hash;
		pinv.amount = amount;
		pinv.credited = credited;
		pinv.paid = false;
		pinv.created_at = store.now();
		return store.add_pay_invoice(pinv).then([this, pay_id, inv, amount, credited]() {
			return Tip::log( bus, Info
				       , "FundingFlow: %s: invoice %s for %s, "
					 "crediting %s"
				       , std::string(pay_id).c_str()
				       , inv.payment_hash.c_str()
				       , std::string(amount).c_str()
				       , std::string(credited).c_str()
				       );
		}).then([this, pay_id, inv, credited]() {
			return runner.launch( "funding " + inv.payment_hash
					    , config.confirm_timeout + task_grace
					    , confirm(pay_id, inv.payment_hash, credited)
					    );
		}).then([inv]() {
			auto out = Json::Out()
				.start_object()
					.field("pr", inv.invoice)
					.start_array("routes")
					.end_array()
				.end_object()
				;
			return Ev::lift(Http::Response::json(200, out));
		});
	}).catching<Refuse>([](Refuse const& r) {
		return Ev::lift(Http::Response::lnurl_error(r.reason));
	}).catching<std::exception>([this](std::exception const& e) {
		return Tip::log( bus, Error
			       , "FundingFlow: callback: %s", e.what()
			       ).then([]() {
			return Ev::lift(Http::Response::lnurl_error("database error"));
		});
	});
}

Ev::Io<void> FundingFlow::confirm( Uuid pay_id
				 , std::string payment_hash
				 , Ln::Amount credited
				 ) {
	return gateway.wait_for_payment( payment_hash
				       , config.confirm_timeout
				       ).then([ this, pay_id
					      , payment_hash, credited
					      ](bool paid) {
		if (!paid)
			return Tip::log( bus, Info
				       , "FundingFlow: %s: not paid in time"
				       , payment_hash.c_str()
				       );
		return store.credit_if_active(pay_id, credited, payment_hash)
			.then([this, pay_id, payment_hash, credited](bool ok) {
			if (ok)
				return Tip::log( bus, Info
					       , "FundingFlow: %s: credited %s"
					       , std::string(pay_id).c_str()
					       , std::string(credited).c_str()
					       );
			return Tip::log( bus, Warn
				       , "FundingFlow: %s: paid %s after the "
					 "voucher became inactive, refunding"
				       , std::string(pay_id).c_str()
				       , payment_hash.c_str()
				       ).then([this, pay_id, credited]() {
				return refund_payer(pay_id, credited);
			});
		});
	});
}

Ev::Io<void> FundingFlow::refund_payer(Uuid pay_id, Ln::Amount credited) {
	return store.get_by_pay_id(pay_id)
		.then([this, pay_id, credited](std::shared_ptr<Voucher> v) {
		if (!v)
			return Tip::log( bus, Error
				       , "CRITICAL: FundingFlow: %s: voucher "
					 "vanished, %s not refunded"
				       , std::string(pay_id).c_str()
				       , std::string(credited).c_str()
				       );
		auto address = v->lightning_address;
		return refunder.refund(address, credited)
			.then([ this, pay_id
			      , address, credited
			      ](Gateway::PayResult res) {
			switch (res.outcome) {
			case Gateway::PayResult::Success:
				return Tip::log( bus, Info
					       , "FundingFlow: %s: refunded %s "
						 "to %s"
					       , std::string(pay_id).c_str()
					       , std::string(credited).c_str()
					       , address.c_str()
					       );
			case Gateway::PayResult::Failed:
				return Tip::log( bus, Error
					       , "CRITICAL: FundingFlow: %s: "
						 "refund of %s to %s failed: %s"
					       , std::string(pay_id).c_str()
					       , std::string(credited).c_str()
					       , address.c_str()
					       , res.detail.c_str()
					       );
			case Gateway::PayResult::Ambiguous:
				break;
			}
			return Tip::log( bus, Error
				       , "CRITICAL: FundingFlow: %s: refund of "
					 "%s to %s has unknown outcome: %s"
				       , std::string(pay_id).c_str()
				       , std::string(credited).c_str()
				       , address.c_str()
				       , res.detail.c_str()
				       );
		});
	});
}

}}
