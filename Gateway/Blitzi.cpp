#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Gateway/Blitzi.hpp"
#include"Http/ClientIF.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Tip/Mod/Waiter.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include<algorithm>

namespace {

auto const api_timeout = double(30);
auto const pay_timeout = double(60);

std::string string_field(Jsmn::Object const& js, char const* key) {
	if (!js.is_object() || !js.has(key))
		return "";
	auto v = js[key];
	if (!v.is_string())
		return "";
	return std::string(v);
}

}

namespace Gateway {

class Blitzi::Impl {
private:
	Http::ClientIF& client;
	Tip::Mod::Waiter& waiter;
	std::string base_url;
	std::string token;
	double poll_interval;

	Http::ClientRequest make( std::string method
				, std::string const& path
				, std::string body
				, double timeout
				) {
		auto req = Http::ClientRequest();
		req.method = std::move(method);
		req.url = base_url + path;
		req.body = std::move(body);
		req.timeout = timeout;
		if (!token.empty())
			req.headers.push_back("Authorization: Bearer " + token);
		return req;
	}

	static
	void check_status( Http::ClientRequest const& req
			 , Http::ClientResponse const& rsp
			 ) {
		if (rsp.status >= 400)
			throw ApiError(Util::Str::fmt(
				"blitzi %s %s status %d: %s",
				req.method.c_str(), req.url.c_str(),
				rsp.status, rsp.body.c_str()
			));
	}

	/* Yields whether the invoice is paid.  */
	Ev::Io<bool> check_paid(std::string const& payment_hash) {
		auto req = make("GET", "/invoice/" + payment_hash, "", api_timeout);
		return client.request(req).then([req](Http::ClientResponse rsp) {
			check_status(req, rsp);
			auto js = Jsmn::Object::parse_json(rsp.body);
			if (!js.is_object() || !js["paid"].is_boolean())
				throw ApiError("blitzi: unexpected invoice status: " + rsp.body);
			return Ev::lift(bool(js["paid"]));
		});
	}

	Ev::Io<bool> poll(std::string const& payment_hash, double end) {
		return Ev::lift().then([this, end]() {
			auto left = end - Ev::now();
			return waiter.wait(std::max(0.0, std::min(poll_interval, left)));
		}).then([this, payment_hash]() {
			/* Network trouble is retried until the deadline.  */
			return check_paid(payment_hash)
				.catching<std::exception>([](std::exception const& _) {
				return Ev::lift(false);
			});
		}).then([this, payment_hash, end](bool paid) {
			if (paid)
				return Ev::lift(true);
			if (Ev::now() >= end)
				return Ev::lift(false);
			return poll(payment_hash, end);
		});
	}

public:
	Impl( Http::ClientIF& client_
	    , Tip::Mod::Waiter& waiter_
	    , std::string base_url_
	    , std::string token_
	    , double poll_interval_
	    ) : client(client_)
	      , waiter(waiter_)
	      , base_url(std::move(base_url_))
	      , token(std::move(token_))
	      , poll_interval(poll_interval_)
	      { }

	Ev::Io<Invoice> create_invoice( Ln::Amount amount
				      , std::string const& description
				      ) {
		auto body = Json::Out()
			.start_object()
				.field("amount_msats", amount.to_msat())
				.field("description", description)
			.end_object()
			.output()
			;
		auto req = make("POST", "/invoice", std::move(body), api_timeout);
		return client.request(req).then([req](Http::ClientResponse rsp) {
			check_status(req, rsp);
			auto js = Jsmn::Object::parse_json(rsp.body);
			auto inv = Invoice();
			inv.payment_hash = string_field(js, "payment_hash");
			inv.invoice = string_field(js, "invoice");
			if (inv.payment_hash.empty() || inv.invoice.empty())
				throw ApiError("blitzi: incomplete invoice response: " + rsp.body);
			return Ev::lift(std::move(inv));
		});
	}

	Ev::Io<bool> wait_for_payment( std::string const& payment_hash
				     , double timeout
				     ) {
		auto end = Ev::now() + timeout;
		return poll(payment_hash, end);
	}

	Ev::Io<PayResult> pay_invoice(std::string const& bolt11) {
		auto body = Json::Out()
			.start_object()
				.field("invoice", bolt11)
			.end_object()
			.output()
			;
		auto req = make("POST", "/pay", std::move(body), pay_timeout);
		return client.request(req).then([](Http::ClientResponse rsp) {
			if (rsp.status >= 400)
				return Ev::lift(PayResult{
					PayResult::Failed,
					Util::Str::fmt( "status %d: %s"
						      , rsp.status
						      , rsp.body.c_str()
						      )
				});
			auto js = Jsmn::Object();
			try {
				js = Jsmn::Object::parse_json(rsp.body);
			} catch (std::exception const& _) {
				/* Some blitzi builds answer a success
				 * with an empty body.  */
				return Ev::lift(PayResult{PayResult::Success, ""});
			}
			auto error = string_field(js, "error");
			auto refused = js.is_object()
				    && js["success"].is_boolean()
				    && !bool(js["success"])
				     ;
			if (refused || !error.empty())
				return Ev::lift(PayResult{PayResult::Failed, error});
			return Ev::lift(PayResult{PayResult::Success, ""});
		}).catching<Http::ClientTimeout>([](Http::ClientTimeout const& e) {
			return Ev::lift(PayResult{PayResult::Ambiguous, e.what()});
		}).catching<Http::ClientError>([](Http::ClientError const& e) {
			if (e.sent())
				return Ev::lift(PayResult{PayResult::Ambiguous, e.what()});
			return Ev::lift(PayResult{PayResult::Failed, e.what()});
		});
	}
};

Blitzi::Blitzi( Http::ClientIF& client
	      , Tip::Mod::Waiter& waiter
	      , std::string base_url
	      , std::string token
	      , double poll_interval
	      ) : pimpl(Util::make_unique<Impl>( client
					       , waiter
					       , std::move(base_url)
					       , std::move(token)
					       , poll_interval
					       ))
		{ }
Blitzi::~Blitzi() { }

Ev::Io<Invoice> Blitzi::create_invoice( Ln::Amount amount
				      , std::string const& description
				      ) {
	return pimpl->create_invoice(amount, description);
}
Ev::Io<bool> Blitzi::wait_for_payment( std::string const& payment_hash
				     , double timeout
				     ) {
	return pimpl->wait_for_payment(payment_hash, timeout);
}
Ev::Io<PayResult> Blitzi::pay_invoice(std::string const& bolt11) {
	return pimpl->pay_invoice(bolt11);
}

}
