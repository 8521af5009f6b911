#include"Http/Response.hpp"
#include"Json/Out.hpp"

namespace Http {

Response Response::json(int status, Json::Out const& js) {
	auto rv = Response();
	rv.status = status;
	rv.body = js.output();
	return rv;
}

Response Response::error(int status, std::string const& message) {
	return json(status, Json::Out()
		.start_object()
			.field("error", message)
		.end_object()
	);
}

Response Response::lnurl_error(std::string const& reason) {
	return json(200, Json::Out()
		.start_object()
			.field("status", std::string("ERROR"))
			.field("reason", reason)
		.end_object()
	);
}

Response Response::lnurl_ok() {
	return json(200, Json::Out()
		.start_object()
			.field("status", std::string("OK"))
		.end_object()
	);
}

}
