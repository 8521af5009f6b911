#ifndef HTTP_SERVER_HPP
#define HTTP_SERVER_HPP

#include"Http/Request.hpp"
#include"Http/Response.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<functional>
#include<memory>
#include<stdexcept>
#include<string>

namespace Ev { template<typename a> class Io; }

namespace Http {

/** Http::ServerError
 *
 * @brief thrown when the server cannot be
 * started.
 */
class ServerError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	ServerError(std::string const& e
		   ) : Util::BacktraceException<std::runtime_error>(
				"Http::Server: " + e
			) { }
};

/** class Http::Server
 *
 * @brief serves HTTP with libevent on a thread
 * of its own.
 *
 * @desc Each request is read completely on the
 * server thread, then handed to the handler on
 * the main libev loop as a greenthread of its
 * own.
 * The response the handler yields is handed back
 * to the server thread to be sent.
 * `OPTIONS` requests are answered on the server
 * thread without involving the handler.
 * Every response allows any origin.
 */
class Server {
public:
	typedef std::function<Ev::Io<Response>(Request)> Handler;

private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Server() =delete;
	Server(Server const&) =delete;

	Server( std::string address
	      , std::uint16_t port
	      , Handler handler
	      );
	~Server();

	/* Binds and starts serving.
	 * Throws `Http::ServerError`.  */
	void start();
	/* Stops serving.  Responses of requests still
	 * being handled are dropped.  */
	void stop();
};

}

#endif /* !defined(HTTP_SERVER_HPP) */
