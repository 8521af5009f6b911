#ifndef HTTP_CLIENTIF_HPP
#define HTTP_CLIENTIF_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }

namespace Http {

/** struct Http::ClientRequest
 *
 * @brief an outbound HTTP request.
 */
struct ClientRequest {
	/* "GET" or "POST".  */
	std::string method;
	std::string url;
	/* Extra "Name: value" header lines.  */
	std::vector<std::string> headers;
	/* Sent as `application/json` if non-empty.  */
	std::string body;
	/* Seconds for the whole exchange.  */
	double timeout;

	ClientRequest() : method("GET"), timeout(30) { }
};

struct ClientResponse {
	int status;
	std::string body;
};

/** Http::ClientError
 *
 * @brief thrown when no HTTP response was
 * received.
 *
 * @desc `sent()` tells whether the request could
 * have reached the server, for callers to whom
 * that makes a difference.
 */
class ClientError : public Util::BacktraceException<std::runtime_error> {
private:
	bool was_sent;

public:
	ClientError( std::string const& e
		   , bool was_sent_ = true
		   ) : Util::BacktraceException<std::runtime_error>(e)
		     , was_sent(was_sent_)
		     { }
	bool sent() const { return was_sent; }
};
/** Http::ClientTimeout
 *
 * @brief thrown when the request timeout passed
 * without a complete response.
 */
class ClientTimeout : public ClientError {
public:
	explicit
	ClientTimeout(std::string const& e) : ClientError(e, true) { }
};

/** class Http::ClientIF
 *
 * @brief interface to an object that performs
 * outbound HTTP requests.
 */
class ClientIF {
public:
	virtual ~ClientIF() { }

	/* Any HTTP status is a response; only failing
	 * to get one throws.  */
	virtual
	Ev::Io<ClientResponse> request(ClientRequest req) =0;
};

}

#endif /* !defined(HTTP_CLIENTIF_HPP) */
