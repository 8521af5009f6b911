#ifndef HTTP_ROUTER_HPP
#define HTTP_ROUTER_HPP

#include"Http/Request.hpp"
#include"Http/Response.hpp"
#include<functional>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }

namespace Http {

/** class Http::Router
 *
 * @brief picks the handler for a request by
 * method and path.
 *
 * @desc A path pattern is a sequence of
 * `/`-separated segments; a `{name}` segment
 * matches any one non-empty segment, which is
 * stored into `Request::params`.
 * A path no route matches is answered 404;
 * a path that matches only under other methods
 * is answered 405.
 * A handler that fails is answered 500.
 */
class Router {
public:
	typedef std::function<Ev::Io<Response>(Request)> Handler;

private:
	struct Route {
		std::string method;
		std::vector<std::string> segments;
		Handler handler;
	};
	std::vector<Route> routes;

	static
	std::vector<std::string> split(std::string const& path);
	static
	bool match( Route const& r
		  , std::vector<std::string> const& segments
		  , std::map<std::string, std::string>& params
		  );

public:
	void add( std::string const& method
		, std::string const& pattern
		, Handler handler
		);

	Ev::Io<Response> dispatch(Request req) const;
};

}

#endif /* !defined(HTTP_ROUTER_HPP) */
