#ifndef HTTP_REQUEST_HPP
#define HTTP_REQUEST_HPP

#include<map>
#include<string>

namespace Http {

/** struct Http::Request
 *
 * @brief an inbound HTTP request, already read
 * completely.
 */
struct Request {
	/* "GET", "POST", and so on.  */
	std::string method;
	/* Decoded path, without the query.  */
	std::string path;
	/* Decoded query parameters.  */
	std::map<std::string, std::string> query;
	std::string body;
	/* Filled in by `Http::Router` from `{name}`
	 * segments of the matching route.  */
	std::map<std::string, std::string> params;

	bool has_query(std::string const& k) const {
		return query.find(k) != query.end();
	}
	/* Empty string if missing.  */
	std::string query_value(std::string const& k) const {
		auto it = query.find(k);
		if (it == query.end())
			return "";
		return it->second;
	}
	std::string param(std::string const& k) const {
		auto it = params.find(k);
		if (it == params.end())
			return "";
		return it->second;
	}
};

}

#endif /* !defined(HTTP_REQUEST_HPP) */
