#include"Ev/Io.hpp"
#include"Http/Router.hpp"
#include"Json/Out.hpp"
#include"Lnurl/codec.hpp"
#include"Tip/Mod/VoucherInfo.hpp"
#include"Tip/Store.hpp"
#include"Tip/log.hpp"
#include"Util/date.hpp"
#include<algorithm>
#include<cmath>
#include<memory>

namespace {

/* Thrown to answer with an API error.  */
struct Reject {
	int status;
	std::string message;
};

Http::Response render( Tip::Voucher const& v
		     , std::string const& kind
		     , double now
		     , double absolute_expiry
		     , std::vector<Tip::PayInvoice> const* funding
		     ) {
	auto active = v.is_active(now, absolute_expiry);
	auto out = Json::Out();
	auto obj = out.start_object();
	obj
		.field("kind", kind)
		.field("balance_msats", v.total_paid.to_msat())
		.field("balance_sats", v.total_paid.to_sat())
		.field("active", active)
		;
	if (active) {
		auto left = v.effective_expiry(absolute_expiry) - now;
		obj.field( "expires_in_seconds"
			 , std::uint64_t(std::floor(std::max(0.0, left)))
			 );
	}
	obj.field("lightning_address", v.lightning_address);
	if (funding) {
		auto arr = obj.start_array("funding");
		for (auto const& inv : *funding)
			arr.start_object()
				.field("paid_at", Util::rfc3339(inv.paid_at))
				.field("credited_msats", inv.credited.to_msat())
			.end_object();
		arr.end_array();
	}
	obj.end_object();
	return Http::Response::json(200, out);
}

}

namespace Tip { namespace Mod {

std::vector<std::string> VoucherInfo::path_segments(std::string const& url) {
	auto path = url;
	auto scheme = path.find("://");
	if (scheme != std::string::npos) {
		auto slash = path.find('/', scheme + 3);
		path = (slash == std::string::npos) ? "" : path.substr(slash);
	}
	auto end = path.find_first_of("?#");
	if (end != std::string::npos)
		path = path.substr(0, end);

	auto rv = std::vector<std::string>();
	auto seg = std::string();
	for (auto c : path) {
		if (c == '/') {
			if (!seg.empty())
				rv.push_back(seg);
			seg.clear();
		} else
			seg.push_back(c);
	}
	if (!seg.empty())
		rv.push_back(seg);
	return rv;
}

void VoucherInfo::start(Http::Router& router) {
	router.add("GET", "/api/vouchers/info", [this](Http::Request req) {
		return info(std::move(req));
	});
}

Ev::Io<Http::Response> VoucherInfo::info(Http::Request req) {
	auto lightning = req.query_value("lightning");
	if (lightning.empty())
		return Ev::lift(Http::Response::error(
			400, "missing lightning parameter"
		));
	auto url = std::string();
	try {
		url = Lnurl::decode(lightning);
	} catch (Lnurl::EncodingError const& e) {
		return Ev::lift(Http::Response::error(
			400, std::string("invalid LNURL: ") + e.what()
		));
	}
	auto segments = path_segments(url);
	if ( segments.size() < 2
	  || (segments[0] != "pay" && segments[0] != "withdraw"))
		return Ev::lift(Http::Response::error(
			400, "not a voucher LNURL"
		));
	auto kind = segments[0];
	if (!Uuid::valid_string(segments[1]))
		return Ev::lift(Http::Response::error(404, "voucher not found"));
	auto id = Uuid(segments[1]);

	auto lookup = (kind == "pay") ? store.get_by_pay_id(id)
				      : store.get_by_withdraw_id(id)
				      ;
	return lookup.then([this, kind](std::shared_ptr<Voucher> v) {
		if (!v)
			throw Reject{404, "voucher not found"};
		auto now = store.now();
		auto absolute_expiry = store.absolute_expiry();
		if (kind != "pay")
			return Ev::lift(render( *v, kind
					      , now, absolute_expiry
					      , nullptr
					      ));
		return store.get_paid_invoices(v->pay_id)
			.then([ v, kind
			      , now, absolute_expiry
			      ](std::vector<PayInvoice> funding) {
			return Ev::lift(render( *v, kind
					      , now, absolute_expiry
					      , &funding
					      ));
		});
	}).catching<Reject>([](Reject const& r) {
		return Ev::lift(Http::Response::error(r.status, r.message));
	}).catching<std::exception>([this](std::exception const& e) {
		return Tip::log( bus, Error
			       , "VoucherInfo: %s", e.what()
			       ).then([]() {
			return Ev::lift(Http::Response::error(500, "database error"));
		});
	});
}

}}
