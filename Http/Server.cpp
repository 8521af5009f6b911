#include"Ev/Io.hpp"
#include"Http/Server.hpp"
#include"Util/make_unique.hpp"
#include<errno.h>
#include<ev.h>
#include<event2/buffer.h>
#include<event2/event.h>
#include<event2/http.h>
#include<event2/keyvalq_struct.h>
#include<event2/thread.h>
#include<fcntl.h>
#include<mutex>
#include<queue>
#include<stdlib.h>
#include<string.h>
#include<thread>
#include<unistd.h>
#include<vector>

namespace {

auto const max_body_size = std::size_t(64 * 1024);
auto const max_headers_size = std::size_t(16 * 1024);

std::string method_name(evhttp_cmd_type cmd) {
	switch (cmd) {
	case EVHTTP_REQ_GET: return "GET";
	case EVHTTP_REQ_POST: return "POST";
	case EVHTTP_REQ_HEAD: return "HEAD";
	case EVHTTP_REQ_PUT: return "PUT";
	case EVHTTP_REQ_DELETE: return "DELETE";
	case EVHTTP_REQ_OPTIONS: return "OPTIONS";
	case EVHTTP_REQ_TRACE: return "TRACE";
	case EVHTTP_REQ_CONNECT: return "CONNECT";
	case EVHTTP_REQ_PATCH: return "PATCH";
	}
	return "";
}

std::string uridecode(char const* s) {
	auto decoded = evhttp_uridecode(s, 0, nullptr);
	if (!decoded)
		return "";
	auto rv = std::string(decoded);
	free(decoded);
	return rv;
}

}

namespace Http {

class Server::Impl {
private:
	std::string address;
	std::uint16_t port;
	Handler handler;

	/*-------------------------------------------------------*/
	/* Owned by the main thread.  Only touched by the
	 * server thread while it runs, and by the main
	 * thread before it starts or after it is joined.  */
	event_base* base;
	evhttp* http;
	event* reply_event;
	std::thread thread;
	bool running;

	/* Main-loop side.  */
	std::unique_ptr<ev_io> io_waiter;
	int pipe_read;
	int pipe_write;

	/*-------------------------------------------------------*/
	/* Shared across threads; hold the mutex.  */
	std::mutex mtx;
	struct Incoming {
		evhttp_request* raw;
		Request req;
	};
	std::queue<Incoming> incoming;
	struct Outgoing {
		evhttp_request* raw;
		Response rsp;
	};
	std::queue<Outgoing> outgoing;
	bool accepting;

	/*-------------------------------------------------------*/
	/* Server thread.  */
	static
	void add_common_headers(evhttp_request* raw) {
		auto headers = evhttp_request_get_output_headers(raw);
		evhttp_add_header(headers, "Access-Control-Allow-Origin", "*");
	}

	static
	void on_request_static(evhttp_request* raw, void* vself) {
		((Impl*) vself)->on_request(raw);
	}
	void on_request(evhttp_request* raw) {
		auto cmd = evhttp_request_get_command(raw);
		if (cmd == EVHTTP_REQ_OPTIONS) {
			add_common_headers(raw);
			auto headers = evhttp_request_get_output_headers(raw);
			evhttp_add_header( headers, "Access-Control-Allow-Methods"
					 , "GET, POST, OPTIONS"
					 );
			evhttp_add_header( headers, "Access-Control-Allow-Headers"
					 , "Content-Type"
					 );
			evhttp_send_reply(raw, 204, "No Content", nullptr);
			return;
		}

		auto uri = evhttp_request_get_evhttp_uri(raw);
		auto path = uri ? evhttp_uri_get_path(uri) : nullptr;
		if (!uri || !path) {
			evhttp_send_reply(raw, HTTP_BADREQUEST, nullptr, nullptr);
			return;
		}

		auto req = Request();
		req.method = method_name(cmd);
		req.path = uridecode(path);

		auto query = evhttp_uri_get_query(uri);
		if (query) {
			evkeyvalq kv;
			if (evhttp_parse_query_str(query, &kv) != 0) {
				evhttp_send_reply(raw, HTTP_BADREQUEST, nullptr, nullptr);
				return;
			}
			for (auto p = kv.tqh_first; p; p = p->next.tqe_next)
				req.query[p->key] = p->value;
			evhttp_clear_headers(&kv);
		}

		auto input = evhttp_request_get_input_buffer(raw);
		auto len = evbuffer_get_length(input);
		if (len > 0) {
			req.body.resize(len);
			evbuffer_copyout(input, &req.body[0], len);
		}

		auto locker = std::unique_lock<std::mutex>(mtx);
		if (!accepting) {
			locker.unlock();
			evhttp_send_reply(raw, 503, "Service Unavailable", nullptr);
			return;
		}
		incoming.push(Incoming{raw, std::move(req)});
		wake_main();
	}

	/* Precondition: the mutex must be locked.  */
	void wake_main() {
		auto c = char(1);
		auto res = ssize_t();
		do {
			res = write(pipe_write, &c, 1);
		} while (res < 0 && errno == EINTR);
	}

	static
	void on_reply_static(evutil_socket_t, short, void* vself) {
		((Impl*) vself)->on_reply();
	}
	void on_reply() {
		auto replies = std::vector<Outgoing>();
		{
			auto locker = std::unique_lock<std::mutex>(mtx);
			while (!outgoing.empty()) {
				replies.emplace_back(std::move(outgoing.front()));
				outgoing.pop();
			}
		}
		for (auto& o : replies) {
			add_common_headers(o.raw);
			auto headers = evhttp_request_get_output_headers(o.raw);
			evhttp_add_header( headers, "Content-Type"
					 , "application/json"
					 );
			auto buf = evbuffer_new();
			evbuffer_add(buf, o.rsp.body.data(), o.rsp.body.size());
			evhttp_send_reply(o.raw, o.rsp.status, nullptr, buf);
			evbuffer_free(buf);
		}
	}

	void run_thread() {
		event_base_dispatch(base);
	}

	/*-------------------------------------------------------*/
	/* Main thread.  */
	static
	void io_handler_static(EV_P_ ev_io* raw_io, int revents) {
		((Impl*) raw_io->data)->io_handler();
	}
	void io_handler() {
		char buf[64];
		for (;;) {
			auto res = read(pipe_read, buf, sizeof(buf));
			if (res < 0 && errno == EINTR)
				continue;
			if (res <= 0)
				break;
		}

		auto requests = std::vector<Incoming>();
		{
			auto locker = std::unique_lock<std::mutex>(mtx);
			while (!incoming.empty()) {
				requests.emplace_back(std::move(incoming.front()));
				incoming.pop();
			}
		}

		for (auto& in : requests) {
			auto raw = in.raw;
			auto io = Ev::lift().then([this, in]() {
				return handler(in.req);
			});
			io.run([this, raw](Response rsp) {
				reply(raw, std::move(rsp));
			}, [this, raw](std::exception_ptr _) {
				reply(raw, Response::error(500, "internal error"));
			});
		}
	}

	void reply(evhttp_request* raw, Response rsp) {
		auto locker = std::unique_lock<std::mutex>(mtx);
		if (!accepting)
			return;
		outgoing.push(Outgoing{raw, std::move(rsp)});
		event_active(reply_event, EV_READ, 0);
	}

	void cleanup() {
		if (reply_event) {
			event_free(reply_event);
			reply_event = nullptr;
		}
		if (http) {
			evhttp_free(http);
			http = nullptr;
		}
		if (base) {
			event_base_free(base);
			base = nullptr;
		}
		if (io_waiter) {
			ev_io_stop(EV_DEFAULT_ io_waiter.get());
			io_waiter = nullptr;
		}
		if (pipe_read >= 0) {
			close(pipe_read);
			close(pipe_write);
			pipe_read = -1;
			pipe_write = -1;
		}
	}

public:
	Impl( std::string address_
	    , std::uint16_t port_
	    , Handler handler_
	    ) : address(std::move(address_))
	      , port(port_)
	      , handler(std::move(handler_))
	      , base(nullptr)
	      , http(nullptr)
	      , reply_event(nullptr)
	      , running(false)
	      , pipe_read(-1)
	      , pipe_write(-1)
	      , accepting(false)
	      { }
	~Impl() {
		stop();
	}

	void start() {
		if (running)
			return;
		if (evthread_use_pthreads() != 0)
			throw ServerError("enabling libevent threads failed");

		int pipes[2];
		if (pipe(pipes) < 0)
			throw ServerError(std::string("pipe: ") + strerror(errno));
		pipe_read = pipes[0];
		pipe_write = pipes[1];
		{
			auto flags = fcntl(pipe_read, F_GETFL);
			fcntl(pipe_read, F_SETFL, flags | O_NONBLOCK);
		}

		base = event_base_new();
		if (!base) {
			cleanup();
			throw ServerError("event_base_new failed");
		}
		http = evhttp_new(base);
		if (!http) {
			cleanup();
			throw ServerError("evhttp_new failed");
		}
		evhttp_set_max_body_size(http, max_body_size);
		evhttp_set_max_headers_size(http, max_headers_size);
		evhttp_set_allowed_methods( http
					  , EVHTTP_REQ_GET
					  | EVHTTP_REQ_POST
					  | EVHTTP_REQ_OPTIONS
					  );
		evhttp_set_gencb(http, &on_request_static, this);
		if (evhttp_bind_socket(http, address.c_str(), port) != 0) {
			cleanup();
			throw ServerError( "cannot listen on " + address + ":"
					 + std::to_string(port)
					 );
		}
		reply_event = event_new( base, -1, EV_PERSIST
				       , &on_reply_static, this
				       );
		if (!reply_event || event_add(reply_event, nullptr) != 0) {
			cleanup();
			throw ServerError("cannot create reply event");
		}

		io_waiter = Util::make_unique<ev_io>();
		ev_io_init(io_waiter.get(), &io_handler_static, pipe_read, EV_READ);
		io_waiter->data = this;
		ev_io_start(EV_DEFAULT_ io_waiter.get());

		{
			auto locker = std::unique_lock<std::mutex>(mtx);
			accepting = true;
		}
		thread = std::thread([this]() { run_thread(); });
		running = true;
	}

	void stop() {
		if (!running)
			return;
		{
			auto locker = std::unique_lock<std::mutex>(mtx);
			accepting = false;
		}
		event_base_loopbreak(base);
		thread.join();
		running = false;
		cleanup();
	}
};

Server::Server( std::string address
	      , std::uint16_t port
	      , Handler handler
	      ) : pimpl(Util::make_unique<Impl>( std::move(address)
					       , port
					       , std::move(handler)
					       ))
		{ }
Server::~Server() { }

void Server::start() {
	pimpl->start();
}
void Server::stop() {
	pimpl->stop();
}

}
