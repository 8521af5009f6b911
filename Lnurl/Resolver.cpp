#include"Ev/Io.hpp"
#include"Http/ClientIF.hpp"
#include"Jsmn/Object.hpp"
#include"Lnurl/Address.hpp"
#include"Lnurl/Resolver.hpp"
#include"Util/Str.hpp"

namespace {

Jsmn::Object parse_answer( std::string const& what
			 , Http::ClientResponse const& rsp
			 ) {
	if (rsp.status != 200)
		throw Lnurl::ResolveError(Util::Str::fmt(
			"%s: status %d", what.c_str(), rsp.status
		));
	auto js = Jsmn::Object();
	try {
		js = Jsmn::Object::parse_json(rsp.body);
	} catch (std::exception const& e) {
		throw Lnurl::ResolveError(what + ": not JSON: " + e.what());
	}
	if (!js.is_object())
		throw Lnurl::ResolveError(what + ": not a JSON object");
	auto status = js["status"];
	if (status.is_string() && std::string(status) == "ERROR") {
		auto reason = js["reason"];
		throw Lnurl::ResolveError(what + ": " + (
			reason.is_string() ? std::string(reason) : std::string("error")
		));
	}
	return js;
}

Ln::Amount amount_field( std::string const& what
		       , Jsmn::Object const& js
		       , char const* key
		       ) {
	auto v = js[key];
	if (!Ln::Amount::valid_object(v))
		throw Lnurl::ResolveError(what + ": bad " + key);
	return Ln::Amount::object(v);
}

}

namespace Lnurl {

Ev::Io<PayParams> Resolver::resolve(std::string const& address) {
	return Ev::lift().then([this, address]() {
		auto a = Address(address);
		auto req = Http::ClientRequest();
		req.url = a.well_known_url();
		req.timeout = timeout;
		return client.request(req);
	}).then([address](Http::ClientResponse rsp) {
		auto what = "resolve " + address;
		auto js = parse_answer(what, rsp);
		auto params = PayParams();
		auto callback = js["callback"];
		if (callback.is_string())
			params.callback = std::string(callback);
		if (params.callback.empty())
			throw ResolveError(what + ": empty callback");
		params.min_sendable = amount_field(what, js, "minSendable");
		params.max_sendable = amount_field(what, js, "maxSendable");
		return Ev::lift(std::move(params));
	});
}

Ev::Io<std::string> Resolver::fetch_invoice( std::string const& callback
					   , Ln::Amount amount
					   ) {
	auto sep = (callback.find('?') == std::string::npos) ? "?" : "&";
	auto req = Http::ClientRequest();
	req.url = Util::Str::fmt( "%s%samount=%llu"
				, callback.c_str(), sep
				, (unsigned long long) amount.to_msat()
				);
	req.timeout = timeout;
	return client.request(req).then([](Http::ClientResponse rsp) {
		auto js = parse_answer("callback", rsp);
		auto pr = js["pr"];
		if (!pr.is_string() || std::string(pr).empty())
			throw ResolveError("callback: empty invoice");
		return Ev::lift(std::string(pr));
	});
}

}
