#include"Ev/Io.hpp"
#include"Gateway/GatewayIF.hpp"
#include"Http/Router.hpp"
#include"Json/Out.hpp"
#include"Lnurl/K1.hpp"
#include"Tip/Config.hpp"
#include"Tip/Mod/WithdrawalFlow.hpp"
#include"Tip/SessionError.hpp"
#include"Tip/Store.hpp"
#include"Tip/links.hpp"
#include"Tip/log.hpp"
#include<memory>

namespace {

/* Thrown to answer with an LNURL error.  */
struct Refuse {
	std::string reason;
};

std::string session_reason(std::string const& detail) {
	return "invalid or already-used k1: " + detail;
}

}

namespace Tip { namespace Mod {

void WithdrawalFlow::start(Http::Router& router) {
	router.add( "GET", "/withdraw/{withdraw_id}"
		  , [this](Http::Request req) {
		return metadata(std::move(req));
	});
	router.add( "GET", "/withdraw/{withdraw_id}/callback"
		  , [this](Http::Request req) {
		return callback(std::move(req));
	});
}

Ev::Io<Http::Response> WithdrawalFlow::metadata(Http::Request req) {
	auto id = req.param("withdraw_id");
	if (!Uuid::valid_string(id))
		return Ev::lift(Http::Response::lnurl_error("voucher not found"));
	auto withdraw_id = Uuid(id);
	auto k1 = Lnurl::K1::random();
	return store.get_by_withdraw_id(withdraw_id)
		.then([this, withdraw_id, k1](std::shared_ptr<Voucher> v) {
		if (!v)
			throw Refuse{"voucher not found"};
		if (!v->is_active(store.now(), store.absolute_expiry()))
			throw Refuse{"voucher is not active"};
		if (v->total_paid == Ln::Amount::msat(0))
			throw Refuse{"voucher has no balance"};
		auto balance = v->total_paid;
		return store.add_withdraw_session(k1, withdraw_id)
			.then([this, withdraw_id, k1, balance]() {
			auto url = withdraw_url(config.base_url, withdraw_id);
			auto out = Json::Out()
				.start_object()
					.field("tag", "withdrawRequest")
					.field("callback", url + "/callback")
					.field("k1", std::string(k1))
					.field("defaultDescription", "TipMe withdrawal")
					.field("minWithdrawable", balance.to_msat())
					.field("maxWithdrawable", balance.to_msat())
					.field("url", info_url(config.base_url, url))
				.end_object()
				;
			return Ev::lift(Http::Response::json(200, out));
		});
	}).catching<Refuse>([](Refuse const& r) {
		return Ev::lift(Http::Response::lnurl_error(r.reason));
	}).catching<std::exception>([this](std::exception const& e) {
		return Tip::log( bus, Error
			       , "WithdrawalFlow: metadata: %s", e.what()
			       ).then([]() {
			return Ev::lift(Http::Response::lnurl_error("database error"));
		});
	});
}

Ev::Io<Http::Response> WithdrawalFlow::callback(Http::Request req) {
	auto id = req.param("withdraw_id");
	auto k1_s = req.query_value("k1");
	auto pr = req.query_value("pr");
	if (k1_s.empty() || pr.empty())
		return Ev::lift(Http::Response::lnurl_error(
			"missing k1 or pr parameter"
		));
	if (!Uuid::valid_string(id) || !Lnurl::K1::valid_string(k1_s))
		return Ev::lift(Http::Response::lnurl_error(session_reason(
			SessionError(SessionError::NotFound).what()
		)));
	auto withdraw_id = Uuid(id);
	auto k1 = Lnurl::K1(k1_s);

	return store.validate_and_consume_session(k1, withdraw_id)
		.catching<SessionError>([this, withdraw_id](SessionError const& e) {
		auto reason = session_reason(e.what());
		return Tip::log( bus
			       , e.kind() == SessionError::AlreadyUsed ? Warn : Info
			       , "WithdrawalFlow: %s: %s"
			       , std::string(withdraw_id).c_str(), e.what()
			       ).then([reason]() -> Ev::Io<Uuid> {
			throw Refuse{reason};
		});
	}).then([this](Uuid pay_id) {
		return store.get_by_pay_id(pay_id);
	}).then([this, pr](std::shared_ptr<Voucher> v) {
		if (!v)
			throw Refuse{"voucher not found"};
		if (!v->is_active(store.now(), store.absolute_expiry()))
			throw Refuse{"voucher is not active"};
		if (v->total_paid == Ln::Amount::msat(0))
			throw Refuse{"voucher has no balance"};
		auto pay_id = v->pay_id;
		/* Another callback may have taken the
		 * balance since the read above.  */
		return store.reserve_for_withdrawal(pay_id)
			.then([this, pr, pay_id](Ln::Amount balance) {
			if (balance == Ln::Amount::msat(0))
				throw Refuse{"voucher is not active"};
			return pay_out(pay_id, balance, pr);
		});
	}).catching<Refuse>([](Refuse const& r) {
		return Ev::lift(Http::Response::lnurl_error(r.reason));
	}).catching<std::exception>([this](std::exception const& e) {
		return Tip::log( bus, Error
			       , "WithdrawalFlow: callback: %s", e.what()
			       ).then([]() {
			return Ev::lift(Http::Response::lnurl_error("database error"));
		});
	});
}

Ev::Io<Http::Response> WithdrawalFlow::pay_out( Uuid pay_id
					      , Ln::Amount balance
					      , std::string pr
					      ) {
	return Tip::log( bus, Info
		       , "WithdrawalFlow: %s: paying out %s"
		       , std::string(pay_id).c_str()
		       , std::string(balance).c_str()
		       ).then([this, pr]() {
		return gateway.pay_invoice(pr);
	}).catching<std::exception>([](std::exception const& e) {
		/* The balance is already taken; we cannot
		 * tell whether the payment went out.  */
		return Ev::lift(Gateway::PayResult{
			Gateway::PayResult::Ambiguous, e.what()
		});
	}).then([this, pay_id, balance](Gateway::PayResult res) {
		return settle(pay_id, balance, res);
	});
}

Ev::Io<Http::Response> WithdrawalFlow::settle( Uuid pay_id
					     , Ln::Amount balance
					     , Gateway::PayResult res
					     ) {
	auto id = std::string(pay_id);
	auto amount = std::string(balance);

	if (res.outcome == Gateway::PayResult::Failed)
		return Tip::log( bus, Warn
			       , "WithdrawalFlow: %s: payout of %s failed, "
				 "restoring balance: %s"
			       , id.c_str(), amount.c_str(), res.detail.c_str()
			       ).then([this, pay_id, balance]() {
			return store.reactivate_with_balance(pay_id, balance);
		}).catching<std::exception>([this, id, amount](std::exception const& e) {
			return Tip::log( bus, Error
				       , "CRITICAL: WithdrawalFlow: %s: payout of "
					 "%s failed but cannot restore it: %s"
				       , id.c_str(), amount.c_str(), e.what()
				       );
		}).then([]() {
			return Ev::lift(Http::Response::lnurl_error("payment failed"));
		});

	auto success = (res.outcome == Gateway::PayResult::Success);
	auto act = Ev::lift();
	if (!success)
		act = Tip::log( bus, Error
			      , "CRITICAL: WithdrawalFlow: %s: payout of %s "
				"has unknown outcome, keeping it deactivated: %s"
			      , id.c_str(), amount.c_str(), res.detail.c_str()
			      );
	return act.then([this, pay_id]() {
		return store.deactivate_for_withdrawal(pay_id);
	}).then([this, success, id, amount]() {
		if (!success)
			return Ev::lift();
		return Tip::log( bus, Info
			       , "WithdrawalFlow: %s: paid out %s"
			       , id.c_str(), amount.c_str()
			       );
	}).catching<std::exception>([this, id, amount](std::exception const& e) {
		return Tip::log( bus, Error
			       , "CRITICAL: WithdrawalFlow: %s: paid out %s "
				 "but cannot deactivate: %s"
			       , id.c_str(), amount.c_str(), e.what()
			       );
	}).then([success]() {
		if (success)
			return Ev::lift(Http::Response::lnurl_ok());
		return Ev::lift(Http::Response::lnurl_error("payment timed out"));
	});
}

}}
