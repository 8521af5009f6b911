#ifndef TIP_CONCURRENT_HPP
#define TIP_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Tip {

/** Tip::concurrent.
 *
 * @brief Like Ev::concurrent except it ignores
 * Tip::Shutdown exceptions in the new greenthread.
 */
Ev::Io<void> concurrent(Ev::Io<void>);

}

#endif /* !defined(TIP_CONCURRENT_HPP) */
