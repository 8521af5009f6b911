#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Http/Client.hpp"
#include"Util/make_unique.hpp"
#include<assert.h>
#include<curl/curl.h>
#include<vector>

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

namespace {

/* Creates a CURL easy handle, then performs one
 * request with it.  */
class EasyHandle {
private:
	std::string body;
	std::vector<char> errbuf;

	curl_slist* headers;
	CURL* curl;

	EasyHandle() {
		errbuf.resize(CURL_ERROR_SIZE);
		for (auto& b : errbuf)
			b = 0;
		headers = NULL;
		curl = curl_easy_init();
		if (!curl)
			throw Http::ClientError("curl_easy_init failed", false);
		curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, &errbuf[0]);
	}
	~EasyHandle() {
		curl_easy_cleanup(curl);
		curl_slist_free_all(headers);
	}

public:
	static
	Http::ClientResponse run(Http::ClientRequest const& req) {
		EasyHandle self;
		return self.run_core(req);
	}

private:
	static
	size_t write_cb_s(char* ptr, size_t size, size_t nmemb, void* vself) {
		assert(size == 1);
		return ((EasyHandle*)vself)->write_cb(ptr, nmemb);
	}
	size_t write_cb(char* ptr, size_t size) {
		body.append(ptr, size);
		return size;
	}

	Http::ClientResponse run_core(Http::ClientRequest const& req) {
		for (auto const& h : req.headers)
			headers = curl_slist_append(headers, h.c_str());
		if (!req.body.empty())
			headers = curl_slist_append( headers
						   , "Content-Type: application/json"
						   );
		headers = curl_slist_append(headers, "Accept: application/json");
		curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

		curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_cb_s);
		curl_easy_setopt(curl, CURLOPT_WRITEDATA, this);
		curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
		curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
		curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
		curl_easy_setopt( curl, CURLOPT_TIMEOUT_MS
				, long(req.timeout * 1000)
				);
		if (req.method == "POST") {
			curl_easy_setopt( curl, CURLOPT_POSTFIELDS
					, req.body.c_str()
					);
			curl_easy_setopt( curl, CURLOPT_POSTFIELDSIZE_LARGE
					, (curl_off_t) req.body.size()
					);
		} else if (req.method != "GET")
			curl_easy_setopt( curl, CURLOPT_CUSTOMREQUEST
					, req.method.c_str()
					);
		curl_easy_setopt( curl, CURLOPT_USERAGENT
				, "tipboss/" PACKAGE_VERSION
				);
		curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
		curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
		curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);

		auto ret = curl_easy_perform(curl);
		if (ret != CURLE_OK) {
			auto msg = req.method + " " + req.url + ": "
				 + std::string(curl_easy_strerror(ret))
				 + ": "
				 + std::string(&errbuf[0])
				 ;
			if (ret == CURLE_OPERATION_TIMEDOUT)
				throw Http::ClientTimeout(msg);
			/* These fail before anything is sent.  */
			auto sent = !( ret == CURLE_COULDNT_RESOLVE_HOST
				    || ret == CURLE_COULDNT_RESOLVE_PROXY
				    || ret == CURLE_COULDNT_CONNECT
				    || ret == CURLE_UNSUPPORTED_PROTOCOL
				    || ret == CURLE_URL_MALFORMAT
				     );
			throw Http::ClientError(msg, sent);
		}

		auto code = long(0);
		curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);

		auto rv = Http::ClientResponse();
		rv.status = int(code);
		rv.body = std::move(body);
		return rv;
	}
};

}

namespace Http {

class Client::Impl {
private:
	Ev::ThreadPool& threadpool;

public:
	Impl() =delete;
	Impl(Impl const&) =delete;
	Impl(Impl&&) =delete;

	explicit
	Impl(Ev::ThreadPool& threadpool_) : threadpool(threadpool_) { }

	Ev::Io<ClientResponse> request(ClientRequest req) {
		auto preq = std::make_shared<ClientRequest>(std::move(req));
		return threadpool.background<ClientResponse>([preq]() {
			return EasyHandle::run(*preq);
		});
	}
};

Client::Client(Ev::ThreadPool& threadpool)
	: pimpl(Util::make_unique<Impl>(threadpool)) { }
Client::Client(Client&&) =default;
Client::~Client() =default;

Ev::Io<ClientResponse> Client::request(ClientRequest req) {
	return pimpl->request(std::move(req));
}

}
