#ifndef TIP_MOD_ALL_HPP
#define TIP_MOD_ALL_HPP

#include<memory>
#include<ostream>

namespace Ev { class ThreadPool; }
namespace Http { class Router; }
namespace S { class Bus; }
namespace Tip { struct Config; }
namespace Tip { class Store; }

namespace Tip { namespace Mod {

/** Tip::Mod::all
 *
 * @brief Constructs all the modules of the
 * service, registering their routes on
 * `router`.
 * Returns a shared pointer to an object that
 * cleans up all modules on destruction.
 */
std::shared_ptr<void> all( std::ostream& cerr
			 , S::Bus& bus
			 , Ev::ThreadPool& threadpool
			 , Http::Router& router
			 , Tip::Store& store
			 , Tip::Config const& config
			 );

}}

#endif /* !defined(TIP_MOD_ALL_HPP) */
