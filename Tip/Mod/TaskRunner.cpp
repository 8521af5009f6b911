#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"S/Bus.hpp"
#include"Tip/Mod/TaskRunner.hpp"
#include"Tip/Mod/Waiter.hpp"
#include"Tip/Shutdown.hpp"
#include"Tip/log.hpp"
#include<memory>
#include<stdexcept>

namespace Tip { namespace Mod {

Ev::Io<void> TaskRunner::launch( std::string name
			       , double deadline
			       , Ev::Io<void> task
			       ) {
	auto pname = std::make_shared<std::string>(std::move(name));
	auto body = Ev::lift().then([this, pname]() {
		return Tip::log( bus, Debug
			       , "TaskRunner: %s: started"
			       , pname->c_str()
			       );
	}).then([this, deadline, task]() {
		return waiter.timed(deadline, task);
	}).catching<Waiter::TimedOut>([this, pname, deadline](Waiter::TimedOut const& _) {
		return Tip::log( bus, Warn
			       , "TaskRunner: %s: abandoned after %.0f seconds"
			       , pname->c_str(), deadline
			       );
	}).catching<std::exception>([this, pname](std::exception const& e) {
		return Tip::log( bus, Error
			       , "TaskRunner: %s: %s"
			       , pname->c_str(), e.what()
			       );
	}).catching<Tip::Shutdown>([](Tip::Shutdown const& _) {
		return Ev::lift();
	}).then([this, pname]() {
		--count;
		return Tip::log( bus, Debug
			       , "TaskRunner: %s: ended"
			       , pname->c_str()
			       );
	});
	return Ev::lift().then([this, body]() {
		++count;
		return Ev::concurrent(body);
	});
}

}}
