#ifndef TIP_SHUTDOWN_HPP
#define TIP_SHUTDOWN_HPP

namespace Tip {

/** struct Tip::Shutdown
 *
 * @brief broadcast on the bus when the process
 * is asked to stop, and thrown by blocking
 * Ev::Io operations that get cancelled by it.
 */
struct Shutdown {};

}

#endif /* !defined(TIP_SHUTDOWN_HPP) */
