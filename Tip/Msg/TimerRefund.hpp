#ifndef TIP_MSG_TIMERREFUND_HPP
#define TIP_MSG_TIMERREFUND_HPP

namespace Tip { namespace Msg {

/** struct Tip::Msg::TimerRefund
 *
 * @brief emitted at startup and then once
 * every refund interval.
 */
struct TimerRefund { };

}}

#endif /* !defined(TIP_MSG_TIMERREFUND_HPP) */
