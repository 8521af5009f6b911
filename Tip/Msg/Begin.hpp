#ifndef TIP_MSG_BEGIN_HPP
#define TIP_MSG_BEGIN_HPP

namespace Tip { namespace Msg {

/** struct Tip::Msg::Begin
 *
 * @brief emitted once all modules are
 * constructed, before the HTTP server starts
 * accepting requests.
 */
struct Begin { };

}}

#endif /* !defined(TIP_MSG_BEGIN_HPP) */
