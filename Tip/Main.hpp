#ifndef TIP_MAIN_HPP
#define TIP_MAIN_HPP

#include<memory>
#include<ostream>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }

namespace Tip {

/** class Tip::Main
 *
 * @brief the whole service, from command line
 * to exit code.
 *
 * @desc Serves until SIGINT or SIGTERM, then
 * raises `Tip::Shutdown` and lets the loop
 * drain.
 */
class Main {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Main() = delete;
	Main( std::vector<std::string> argv
	    , std::ostream& cout
	    , std::ostream& cerr
	    );
	Main(Main&&);
	~Main();

	Ev::Io<int> run();
};

}

#endif /* !defined(TIP_MAIN_HPP) */
