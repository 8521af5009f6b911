#include<Ev/Io.hpp>
#include<Ev/start.hpp>
#include<Tip/Main.hpp>
#include<curl/curl.h>
#include<iostream>
#include<memory>
#include<signal.h>
#include<sodium.h>

namespace {

Ev::Io<int> io_main(int argc, char **argv) {
	auto arg_vec = std::vector<std::string>();
	for (int i = 0; i < argc; ++i) {
		arg_vec.push_back(std::string(argv[i]));
	}
	auto main_obj = std::make_shared<Tip::Main>(
		arg_vec, std::cout, std::cerr
	);
	return main_obj->run().then([main_obj](int ec) {
		/* Ensures main_obj is alive!  */
		return Ev::lift(ec);
	});
}

}

int main (int argc, char **argv) {
	if (sodium_init() < 0) {
		std::cerr << argv[0] << ": libsodium failed to initialize"
			  << std::endl;
		return 1;
	}
	if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
		std::cerr << argv[0] << ": libcurl failed to initialize"
			  << std::endl;
		return 1;
	}
	/* A client that hangs up early must not kill us.  */
	signal(SIGPIPE, SIG_IGN);

	auto code = io_main(argc, argv);
	auto rv = Ev::start(code);

	curl_global_cleanup();
	return rv;
}
