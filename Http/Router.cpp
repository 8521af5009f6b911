#include"Ev/Io.hpp"
#include"Http/Router.hpp"

namespace Http {

std::vector<std::string> Router::split(std::string const& path) {
	auto rv = std::vector<std::string>();
	auto cur = std::string();
	for (auto c : path) {
		if (c == '/') {
			if (!cur.empty())
				rv.push_back(std::move(cur));
			cur.clear();
		} else
			cur.push_back(c);
	}
	if (!cur.empty())
		rv.push_back(std::move(cur));
	return rv;
}

bool Router::match( Route const& r
		  , std::vector<std::string> const& segments
		  , std::map<std::string, std::string>& params
		  ) {
	if (r.segments.size() != segments.size())
		return false;
	auto found = std::map<std::string, std::string>();
	for (auto i = std::size_t(0); i < segments.size(); ++i) {
		auto const& pat = r.segments[i];
		if ( pat.size() > 2
		  && pat.front() == '{' && pat.back() == '}'
		   )
			found[pat.substr(1, pat.size() - 2)] = segments[i];
		else if (pat != segments[i])
			return false;
	}
	params = std::move(found);
	return true;
}

void Router::add( std::string const& method
		, std::string const& pattern
		, Handler handler
		) {
	routes.push_back(Route{method, split(pattern), std::move(handler)});
}

Ev::Io<Response> Router::dispatch(Request req) const {
	auto segments = split(req.path);
	auto path_known = false;
	for (auto const& r : routes) {
		auto params = std::map<std::string, std::string>();
		if (!match(r, segments, params))
			continue;
		path_known = true;
		if (r.method != req.method)
			continue;
		req.params = std::move(params);
		auto handler = r.handler;
		return Ev::lift().then([handler, req]() {
			return handler(req);
		}).catching<std::exception>([](std::exception const& _) {
			return Ev::lift(Response::error(500, "internal error"));
		});
	}
	if (path_known)
		return Ev::lift(Response::error(405, "method not allowed"));
	return Ev::lift(Response::error(404, "not found"));
}

}
