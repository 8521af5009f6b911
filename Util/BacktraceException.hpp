#ifndef UTIL_BACKTRACE_EXCEPTION_HPP
#define UTIL_BACKTRACE_EXCEPTION_HPP

#include<utility>

namespace Util {

/** class Util::BacktraceException<E>
 *
 * @brief Common base wrapper for the exceptions this
 * program throws, so that every failure that crosses
 * an `Ev::Io` boundary has a single shape.
 *
 * @desc Forwards its constructor arguments to `E`.
 */
template<typename E>
class BacktraceException : public E {
public:
	template<typename... Args>
	BacktraceException(Args&&... args)
		: E(std::forward<Args>(args)...) { }

	const char* what() const noexcept override {
		return E::what();
	}
};

}

#endif /* !defined(UTIL_BACKTRACE_EXCEPTION_HPP) */
