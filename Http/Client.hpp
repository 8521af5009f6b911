#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include"Http/ClientIF.hpp"
#include<memory>

namespace Ev { class ThreadPool; }

namespace Http {

/** class Http::Client
 *
 * @brief performs outbound HTTP with libcurl on
 * a background thread of the given pool.
 */
class Client : public ClientIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Client() =delete;
	Client(Client const&) =delete;

	explicit
	Client(Ev::ThreadPool& threadpool);
	Client(Client&&);
	~Client();

	Ev::Io<ClientResponse> request(ClientRequest req) override;
};

}

#endif /* !defined(HTTP_CLIENT_HPP) */
