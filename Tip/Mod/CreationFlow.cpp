#include"Ev/Io.hpp"
#include"Gateway/GatewayIF.hpp"
#include"Http/Router.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Lnurl/Address.hpp"
#include"Lnurl/codec.hpp"
#include"Tip/Config.hpp"
#include"Tip/Mod/CreationFlow.hpp"
#include"Tip/Mod/TaskRunner.hpp"
#include"Tip/Store.hpp"
#include"Tip/links.hpp"
#include"Tip/log.hpp"
#include"Util/Str.hpp"
#include"Util/date.hpp"
#include<cmath>
#include<memory>

namespace {

/* Grace period past the confirmation timeout, so
 * that the confirmation task can still mark the
 * request expired before the runner abandons it.  */
auto const task_grace = double(120);

/* Thrown when the gateway cannot make the
 * creation invoice.  */
struct InvoiceFailed { };

}

namespace Tip { namespace Mod {

void CreationFlow::start(Http::Router& router) {
	router.add( "POST", "/api/vouchers/invoice"
		  , [this](Http::Request req) {
		return create(std::move(req));
	});
	router.add( "GET", "/api/vouchers/status/{payment_hash}"
		  , [this](Http::Request req) {
		return status(std::move(req));
	});
}

Ev::Io<Http::Response> CreationFlow::create(Http::Request req) {
	auto js = Jsmn::Object();
	try {
		js = Jsmn::Object::parse_json(req.body);
	} catch (std::exception const& _) {
		return Ev::lift(Http::Response::error(400, "invalid JSON body"));
	}
	if (!js.is_object())
		return Ev::lift(Http::Response::error(400, "invalid JSON body"));

	auto address_j = js["lightning_address"];
	if (!address_j.is_string()
	 || !Lnurl::Address::valid_string(std::string(address_j)))
		return Ev::lift(Http::Response::error(
			400, "invalid lightning address"
		));
	auto address = std::string(address_j);

	auto count_j = js["count"];
	auto count_d = count_j.is_number() ? double(count_j) : 0.0;
	if ( count_d < 1 || count_d > double(config.max_vouchers)
	  || std::floor(count_d) != count_d)
		return Ev::lift(Http::Response::error(400, Util::Str::fmt(
			"count must be between 1 and %u",
			(unsigned) config.max_vouchers
		)));
	auto count = std::uint32_t(count_d);

	auto expiry = double(0);
	auto expiry_j = js["expiry_seconds"];
	if (expiry_j.is_number())
		expiry = std::floor(double(expiry_j));
	if (expiry <= 0)
		expiry = config.default_relative_expiry;
	/* No voucher outlives its absolute expiry anyway.  */
	if (!std::isfinite(expiry) || expiry > config.absolute_expiry)
		return Ev::lift(Http::Response::error(400, Util::Str::fmt(
			"expiry_seconds must be at most %.0f",
			config.absolute_expiry
		)));

	auto fee = Ln::Amount::sat(config.fee_per_voucher_sats * count);
	auto description = Util::Str::fmt( "TipMe: create %u voucher(s)"
					 , (unsigned) count
					 );

	return Ev::lift().then([this, fee, description]() {
		return gateway.create_invoice(fee, description);
	}).catching<std::exception>([this](std::exception const& e) {
		return Tip::log( bus, Error
			       , "CreationFlow: cannot create invoice: %s"
			       , e.what()
			       ).then([]() -> Ev::Io<Gateway::Invoice> {
			throw InvoiceFailed();
		});
	}).then([this, address, count, expiry, fee](Gateway::Invoice inv) {
		auto creq = CreationRequest();
		creq.payment_hash = inv.payment_hash;
		creq.lightning_address = address;
		creq.count = count;
		creq.expiry_seconds = expiry;
		creq.fee = fee;
		creq.status = CreationRequest::Pending;
		creq.created_at = store.now();
		return store.add_creation_request(creq).then([this, inv, count]() {
			return Tip::log( bus, Info
				       , "CreationFlow: %s: awaiting payment "
					 "for %u voucher(s)"
				       , inv.payment_hash.c_str()
				       , (unsigned) count
				       );
		}).then([this, inv]() {
			return runner.launch( "creation " + inv.payment_hash
					    , config.confirm_timeout + task_grace
					    , confirm(inv.payment_hash)
					    );
		}).then([inv, fee]() {
			auto out = Json::Out()
				.start_object()
					.field("invoice", inv.invoice)
					.field("payment_hash", inv.payment_hash)
					.field("fee_sats", fee.to_sat())
				.end_object()
				;
			return Ev::lift(Http::Response::json(200, out));
		});
	}).catching<InvoiceFailed>([](InvoiceFailed const& _) {
		return Ev::lift(Http::Response::error(
			502, "failed to create invoice"
		));
	}).catching<std::exception>([this](std::exception const& e) {
		return Tip::log( bus, Error
			       , "CreationFlow: cannot record request: %s"
			       , e.what()
			       ).then([]() {
			return Ev::lift(Http::Response::error(500, "database error"));
		});
	});
}

Ev::Io<void> CreationFlow::confirm(std::string const& payment_hash) {
	return gateway.wait_for_payment( payment_hash
				       , config.confirm_timeout
				       ).then([this, payment_hash](bool paid) {
		if (!paid)
			return Tip::log( bus, Info
				       , "CreationFlow: %s: not paid in time"
				       , payment_hash.c_str()
				       ).then([this, payment_hash]() {
				return store.expire_creation(payment_hash);
			}).then([](bool) {
				return Ev::lift();
			});
		return store.complete_creation(payment_hash)
			.then([this, payment_hash](bool done) {
			if (!done)
				return Tip::log( bus, Warn
					       , "CreationFlow: %s: paid, but "
						 "no longer pending"
					       , payment_hash.c_str()
					       );
			return Tip::log( bus, Info
				       , "CreationFlow: %s: vouchers created"
				       , payment_hash.c_str()
				       );
		}).catching<std::exception>([this, payment_hash](std::exception const& e) {
			return Tip::log( bus, Error
				       , "CreationFlow: %s: paid, but cannot "
					 "create vouchers: %s"
				       , payment_hash.c_str(), e.what()
				       ).then([this, payment_hash]() {
				return store.expire_creation(payment_hash);
			}).then([](bool) {
				return Ev::lift();
			});
		});
	});
}

Ev::Io<Http::Response> CreationFlow::status(Http::Request req) {
	auto payment_hash = req.param("payment_hash");
	return store.get_creation_request(payment_hash)
		.then([this](std::shared_ptr<CreationRequest> creq) {
		if (!creq)
			return Ev::lift(Http::Response::error(
				404, "creation request not found"
			));
		auto status = CreationRequest::status_string(creq->status);
		if (creq->status != CreationRequest::Complete) {
			auto out = Json::Out()
				.start_object()
					.field("status", status)
				.end_object()
				;
			return Ev::lift(Http::Response::json(200, out));
		}
		return store.get_batch(creq->payment_hash)
			.then([this, status](std::vector<Voucher> batch) {
			auto out = Json::Out();
			auto obj = out.start_object();
			obj.field("status", status);
			auto arr = obj.start_array("vouchers");
			for (auto const& v : batch) {
				auto const& base = config.base_url;
				auto pay = pay_url(base, v.pay_id);
				auto withdraw = withdraw_url(base, v.withdraw_id);
				auto expires = v.created_at
					     + store.absolute_expiry();
				arr.start_object()
					.field("lnurl_pay", Lnurl::encode(pay))
					.field("lnurl_withdraw", Lnurl::encode(withdraw))
					.field("pay_info_url", info_url(base, pay))
					.field("withdraw_info_url", info_url(base, withdraw))
					.field("lightning_address", v.lightning_address)
					.field("absolute_expiry", Util::rfc3339(expires))
					.field( "relative_expiry_seconds"
					      , std::uint64_t(v.expiry_seconds)
					      )
				.end_object();
			}
			arr.end_array();
			obj.end_object();
			return Ev::lift(Http::Response::json(200, out));
		});
	}).catching<std::exception>([this](std::exception const& e) {
		return Tip::log( bus, Error
			       , "CreationFlow: status: %s"
			       , e.what()
			       ).then([]() {
			return Ev::lift(Http::Response::error(500, "database error"));
		});
	});
}

}}
