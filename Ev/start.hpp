#ifndef EV_START_HPP
#define EV_START_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief runs the given action in the default
 * libev loop, returning when the loop has no
 * more active watchers.
 *
 * @return the exit code yielded by the action,
 * or 254 if it threw.
 */
int start(Io<int> main);

}

#endif /* !defined(EV_START_HPP) */
