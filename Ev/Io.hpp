#ifndef EV_IO_HPP
#define EV_IO_HPP

#include<exception>
#include<functional>
#include<memory>
#include<type_traits>
#include<utility>

namespace Ev {

template<typename a>
class Io;

namespace Detail {

/* Given an Io<a>, extract the type a.  */
template<typename t>
struct IoInner;
template<typename a>
struct IoInner<Io<a>> {
	using type = a;
};

/* Given a type a, give the std::function that accepts that type.  */
template<typename a>
struct PassFunc {
	using type = std::function<void(a)>;
};
template<>
struct PassFunc<void> {
	using type = std::function<void()>;
};

/* Result type of `then`, depending on whether the continuation
 * takes an argument.  */
template<typename a, typename f>
struct ThenResult {
	using type = typename IoInner<typename std::result_of<f(a)>::type>::type;
};
template<typename f>
struct ThenResult<void, f> {
	using type = typename IoInner<typename std::result_of<f()>::type>::type;
};

/* Guards a pass function so that the action completes at most once.  */
template<typename a>
struct Once {
	static typename PassFunc<a>::type
	wrap(std::shared_ptr<bool> done, typename PassFunc<a>::type pass) {
		return [done, pass](a value) {
			if (*done)
				return;
			*done = true;
			pass(std::move(value));
		};
	}
};
template<>
struct Once<void> {
	static PassFunc<void>::type
	wrap(std::shared_ptr<bool> done, PassFunc<void>::type pass) {
		return [done, pass]() {
			if (*done)
				return;
			*done = true;
			pass();
		};
	}
};

/* Builds the pass function that feeds a result into the next
 * stage of a `then` chain.  */
template<typename a>
struct Continue {
	template<typename b, typename f>
	static typename PassFunc<a>::type
	make( f func
	    , typename PassFunc<b>::type pass
	    , std::function<void(std::exception_ptr)> fail
	    ) {
		return [func, pass, fail](a value) {
			auto next = std::unique_ptr<Io<b>>();
			try {
				next.reset(new Io<b>(func(std::move(value))));
			} catch (...) {
				fail(std::current_exception());
				return;
			}
			next->run(pass, fail);
		};
	}
};
template<>
struct Continue<void> {
	template<typename b, typename f>
	static PassFunc<void>::type
	make( f func
	    , typename PassFunc<b>::type pass
	    , std::function<void(std::exception_ptr)> fail
	    ) {
		return [func, pass, fail]() {
			auto next = std::unique_ptr<Io<b>>();
			try {
				next.reset(new Io<b>(func()));
			} catch (...) {
				fail(std::current_exception());
				return;
			}
			next->run(pass, fail);
		};
	}
};

}

/** class Ev::Io<a>
 *
 * @brief an action that, when run, eventually
 * yields a value of type `a` or fails with an
 * exception.
 *
 * @desc A continuation monad.
 * Actions are composed with `then` and
 * `catching`, and only do anything when `run`,
 * which is normally done by `Ev::start` or
 * `Ev::concurrent`.
 */
template<typename a>
class Io {
public:
	typedef typename Detail::PassFunc<a>::type PassFunc;
	typedef std::function<void(std::exception_ptr)> FailFunc;
	typedef std::function<void(PassFunc, FailFunc)> CoreFunc;

private:
	CoreFunc core;

public:
	Io(CoreFunc core_) : core(std::move(core_)) { }

	/* (>>=) :: IO a -> (a -> IO b) -> IO b */
	template<typename f>
	Io<typename Detail::ThenResult<a, f>::type>
	then(f func) const {
		using b = typename Detail::ThenResult<a, f>::type;
		auto core_copy = core;
		return Io<b>([ core_copy
			     , func
			     ]( typename Io<b>::PassFunc pass
			      , FailFunc fail
			      ) {
			auto sub_pass = Detail::Continue<a>::template make<b>(
				func, pass, fail
			);
			core_copy(std::move(sub_pass), fail);
		});
	}

	/* Handles exceptions of type e thrown by this action.
	 * Other exceptions propagate.  */
	template<typename e>
	Io<a> catching(std::function<Io<a>(e const&)> handler) const {
		auto core_copy = core;
		return Io<a>([ core_copy
			     , handler
			     ]( PassFunc pass
			      , FailFunc fail
			      ) {
			auto sub_fail = [ pass, fail
					, handler
					](std::exception_ptr err) {
				auto next = std::unique_ptr<Io<a>>();
				try {
					std::rethrow_exception(err);
				} catch (e const& ex) {
					try {
						next.reset(new Io<a>(handler(ex)));
					} catch (...) {
						fail(std::current_exception());
						return;
					}
				} catch (...) {
					fail(std::current_exception());
					return;
				}
				next->run(pass, fail);
			};
			core_copy(pass, sub_fail);
		});
	}

	void run(PassFunc pass, FailFunc fail) const noexcept {
		auto done = std::make_shared<bool>(false);
		auto sub_pass = Detail::Once<a>::wrap(done, std::move(pass));
		auto sub_fail = [done, fail](std::exception_ptr e) {
			if (*done)
				return;
			*done = true;
			fail(std::move(e));
		};
		try {
			core(std::move(sub_pass), sub_fail);
		} catch (...) {
			sub_fail(std::current_exception());
		}
	}
};

template<typename a>
Io<a> lift(a val) {
	auto container = std::make_shared<a>(std::move(val));
	return Io<a>([container]( std::function<void(a)> pass
				, std::function<void(std::exception_ptr)> _
				) {
		pass(std::move(*container));
	});
}
inline
Io<void> lift() {
	return Io<void>([]( std::function<void()> pass
			  , std::function<void(std::exception_ptr)> _
			  ) {
		pass();
	});
}

}

#endif /* !defined(EV_IO_HPP) */
