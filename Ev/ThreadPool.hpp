#ifndef EV_THREADPOOL_HPP
#define EV_THREADPOOL_HPP

#include<cstddef>
#include<functional>
#include<memory>
#include"Ev/Io.hpp"

namespace Ev {

/* Keeps the main loop responsive while blocking
 * calls (outbound HTTP through libcurl) run.
 * The blocking call is made in a background
 * thread and the calling greenthread is resumed
 * on the main loop once it returns.
 */
class ThreadPool {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	/* i.e. this accepts a function of type
	 * () -> () -> ()
	 * The first stage is executed in a
	 * background thread.
	 * The second stage is executed in
	 * the main thread.
	 */
	void add(std::function<std::function<void()>()>);

public:
	explicit
	ThreadPool(std::size_t num_threads = 8);
	~ThreadPool();
	ThreadPool(ThreadPool const&) =delete;
	ThreadPool(ThreadPool&&) =delete;

	template<typename a>
	Ev::Io<a> background(std::function<a()> func) {
		auto funptr = std::make_shared<std::function<a()>>
			( std::move(func) );
		return Ev::Io<a>([ funptr
				 , this
				 ]( std::function<void(a)> pass
				  , std::function<void(std::exception_ptr)> fail
				  ) {
			auto stage1 = [funptr, pass, fail]() {
				auto stage2 = std::function<void()>();
				try {
					auto res = std::make_shared<a>(
						(*funptr)()
					);
					stage2 = [pass, res]() {
						pass(std::move(*res));
					};
				} catch (...) {
					auto e = std::current_exception();
					stage2 = [fail, e]() {
						fail(e);
					};
				}
				return stage2;
			};
			add(stage1);
		});
	}
};

}

#endif /* EV_THREADPOOL_HPP */
