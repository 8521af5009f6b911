#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Http/Router.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include<assert.h>
#include<stdexcept>

namespace {

Http::Request request(std::string method, std::string path) {
	auto req = Http::Request();
	req.method = std::move(method);
	req.path = std::move(path);
	return req;
}

}

int main() {
	/* Canned bodies.  */
	assert(Http::Response::lnurl_ok().body == "{\"status\": \"OK\"}");
	assert(Http::Response::lnurl_ok().status == 200);
	{
		auto rsp = Http::Response::lnurl_error("voucher not found");
		assert(rsp.status == 200);
		auto js = Jsmn::Object::parse_json(rsp.body);
		assert(std::string(js["status"]) == "ERROR");
		assert(std::string(js["reason"]) == "voucher not found");
	}
	{
		auto rsp = Http::Response::error(404, "not \"here\"");
		assert(rsp.status == 404);
		auto js = Jsmn::Object::parse_json(rsp.body);
		assert(std::string(js["error"]) == "not \"here\"");
	}

	Http::Router router;
	auto seen = std::string();

	router.add("GET", "/pay/{pay_id}", [&](Http::Request req) {
		seen = "pay " + req.param("pay_id");
		return Ev::lift(Http::Response::lnurl_ok());
	});
	router.add("GET", "/pay/{pay_id}/callback", [&](Http::Request req) {
		seen = "callback " + req.param("pay_id") + " " + req.query_value("amount");
		return Ev::lift(Http::Response::lnurl_ok());
	});
	router.add("POST", "/api/vouchers/invoice", [&](Http::Request req) {
		seen = "invoice " + req.body;
		return Ev::lift(Http::Response::json(200, Json::Out()
			.start_object()
				.field("ok", true)
			.end_object()
		));
	});
	router.add("GET", "/boom", [&](Http::Request req) {
		return Ev::lift().then([]() -> Ev::Io<Http::Response> {
			throw std::runtime_error("handler bug");
		});
	});
	router.add("GET", "/boom-now", [&](Http::Request req) -> Ev::Io<Http::Response> {
		throw std::runtime_error("handler bug");
	});

	auto code = Ev::lift().then([&]() {
		return router.dispatch(request("GET", "/pay/abc"));
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 200);
		assert(seen == "pay abc");

		auto req = request("GET", "/pay/abc/callback/");
		req.query["amount"] = "1000";
		return router.dispatch(req);
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 200);
		assert(seen == "callback abc 1000");

		auto req = request("POST", "/api/vouchers/invoice");
		req.body = "{}";
		return router.dispatch(req);
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 200);
		assert(rsp.body == "{\"ok\": true}");
		assert(seen == "invoice {}");

		return router.dispatch(request("GET", "/api/vouchers/invoice"));
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 405);
		return router.dispatch(request("GET", "/pay"));
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 404);
		return router.dispatch(request("GET", "/pay/a/b/c"));
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 404);
		return router.dispatch(request("GET", "/"));
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 404);
		return router.dispatch(request("GET", "/boom"));
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 500);
		assert(std::string(Jsmn::Object::parse_json(rsp.body)["error"]) == "internal error");
		return router.dispatch(request("GET", "/boom-now"));
	}).then([&](Http::Response rsp) {
		assert(rsp.status == 500);

		return Ev::lift(0);
	});

	return Ev::start(code);
}
