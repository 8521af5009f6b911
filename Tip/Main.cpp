#include<assert.h>
#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Ev/now.hpp"
#include"Ev/yield.hpp"
#include"Http/Router.hpp"
#include"Http/Server.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Tip/Config.hpp"
#include"Tip/Main.hpp"
#include"Tip/Mod/all.hpp"
#include"Tip/Msg/Begin.hpp"
#include"Tip/Shutdown.hpp"
#include"Tip/Store.hpp"
#include"Tip/log.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<signal.h>

#ifdef HAVE_CONFIG_H
# include "config.h"
#endif

namespace Tip {

class Main::Impl {
private:
	std::ostream& cout;
	std::ostream& cerr;

	Tip::Config config;

	std::unique_ptr<S::Bus> bus;
	std::unique_ptr<Ev::ThreadPool> threadpool;
	std::unique_ptr<Tip::Store> store;
	std::shared_ptr<Http::Router> router;
	std::unique_ptr<Http::Server> server;
	std::shared_ptr<void> modules;

	ev_signal sigint;
	ev_signal sigterm;
	std::function<void(int)> on_signal;

	int exit_code;

	std::string argv0;
	bool is_version;
	bool is_help;
	std::string bad_option;

	static
	void signal_handler(EV_P_ ev_signal* raw, int revents) {
		((Impl*) raw->data)->signalled(raw->signum);
	}
	void signalled(int signum) {
		ev_signal_stop(EV_DEFAULT_ &sigint);
		ev_signal_stop(EV_DEFAULT_ &sigterm);
		auto pass = std::move(on_signal);
		on_signal = nullptr;
		if (pass)
			pass(signum);
	}

	/* Yields the number of the first SIGINT or
	 * SIGTERM.  */
	Ev::Io<int> wait_for_signal() {
		return Ev::Io<int>([this]( std::function<void(int)> pass
					 , std::function<void(std::exception_ptr)> _
					 ) {
			on_signal = std::move(pass);
			ev_signal_init(&sigint, &signal_handler, SIGINT);
			sigint.data = this;
			ev_signal_start(EV_DEFAULT_ &sigint);
			ev_signal_init(&sigterm, &signal_handler, SIGTERM);
			sigterm.data = this;
			ev_signal_start(EV_DEFAULT_ &sigterm);
		});
	}

	void usage(std::ostream& out) {
		out << "Usage: " << argv0 << " [--name=value]..." << std::endl
		    << std::endl
		    << "Options:" << std::endl
		    << " --version, -V      Show version." << std::endl
		    << " --help, -H         Show this help." << std::endl
		    << Tip::Config::usage()
		    << std::endl
		    << "Send bug reports to: " << PACKAGE_BUGREPORT << std::endl
		    ;
	}

public:
	Impl( std::vector<std::string> argv
	    , std::ostream& cout_
	    , std::ostream& cerr_
	    ) : cout(cout_)
	      , cerr(cerr_)
	      , exit_code(0)
	      , is_version(false)
	      , is_help(false)
	      {
		assert(argv.size() >= 1);
		argv0 = argv[0];
		for (auto i = std::size_t(1); i < argv.size(); ++i) {
			auto const& arg = argv[i];
			if (arg == "--version" || arg == "-V")
				is_version = true;
			else if (arg == "--help" || arg == "-H")
				is_help = true;
			else {
				try {
					config.set_argument(arg);
				} catch (Tip::ConfigError const& e) {
					bad_option = e.what();
					break;
				}
			}
		}
	}

	Ev::Io<int> run() {
		if (!bad_option.empty()) {
			cerr << argv0 << ": " << bad_option << std::endl;
			usage(cerr);
			return Ev::lift(1);
		} else if (is_version) {
			cout << PACKAGE_STRING << std::endl;
			return Ev::lift(0);
		} else if (is_help) {
			usage(cout);
			return Ev::lift(0);
		}

		/* Build our components.  */
		try {
			auto db = Sqlite3::Db(config.db);
			bus = Util::make_unique<S::Bus>();
			threadpool = Util::make_unique<Ev::ThreadPool>();
			store = Util::make_unique<Tip::Store>(
				db, config.absolute_expiry, []() {
					return Ev::now();
				}
			);
		} catch (std::exception const& e) {
			cerr << argv0 << ": " << e.what() << std::endl;
			return Ev::lift(1);
		}
		router = std::make_shared<Http::Router>();
		modules = Tip::Mod::all( cerr
				       , *bus
				       , *threadpool
				       , *router
				       , *store
				       , config
				       );
		auto r = router;
		server = Util::make_unique<Http::Server>(
			config.listen, config.port,
			[r](Http::Request req) {
				return r->dispatch(std::move(req));
			}
		);

		return Ev::yield().then([this]() {
			return store->init();
		}).then([this]() {
			server->start();
			return Tip::log( *bus, Info
				       , "Main: %s listening on %s:%u"
				       , PACKAGE_STRING
				       , config.listen.c_str()
				       , (unsigned) config.port
				       );
		}).then([this]() {
			/* Begin.  */
			return bus->raise(Tip::Msg::Begin());
		}).then([this]() {
			/* Main loop.  */
			return wait_for_signal();
		}).then([this](int signum) {
			return Tip::log( *bus, Info
				       , "Main: signal %d, shutting down"
				       , signum
				       );
		}).catching<std::exception>([this](std::exception const& e) {
			cerr << argv0 << ": " << e.what() << std::endl;
			exit_code = 1;
			return Ev::lift();
		}).then([this]() {
			/* Finish.  */
			server->stop();
			return bus->raise(Tip::Shutdown());
		}).then([this]() {
			return Ev::lift(exit_code);
		});
	}
};

Main::Main( std::vector<std::string> argv
	  , std::ostream& cout
	  , std::ostream& cerr
	  ) : pimpl(Util::make_unique<Impl>( std::move(argv)
					   , cout
					   , cerr
					   ))
	    { }
Main::Main(Main&& o) : pimpl(std::move(o.pimpl)) { }
Main::~Main() { }

Ev::Io<int> Main::run() {
	assert(pimpl);
	return pimpl->run();
}

}
