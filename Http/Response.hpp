#ifndef HTTP_RESPONSE_HPP
#define HTTP_RESPONSE_HPP

#include<string>

namespace Json { class Out; }

namespace Http {

/** struct Http::Response
 *
 * @brief a JSON response.
 */
struct Response {
	int status;
	std::string body;

	static Response json(int status, Json::Out const& js);
	/* `{"error": message}`, for the API surface.  */
	static Response error(int status, std::string const& message);

	/* `{"status":"ERROR","reason":reason}` with
	 * status 200, as LNURL wallets expect.  */
	static Response lnurl_error(std::string const& reason);
	/* `{"status":"OK"}`.  */
	static Response lnurl_ok();
};

}

#endif /* !defined(HTTP_RESPONSE_HPP) */
