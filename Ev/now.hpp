#ifndef EV_NOW_HPP
#define EV_NOW_HPP

namespace Ev {

/** Ev::now
 *
 * @brief returns the current time, in seconds
 * from the epoch.
 */
double now();

}

#endif /* !defined(EV_NOW_HPP) */
