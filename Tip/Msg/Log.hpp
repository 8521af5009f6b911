#ifndef TIP_MSG_LOG_HPP
#define TIP_MSG_LOG_HPP

#include"Tip/log.hpp"
#include<string>

namespace Tip { namespace Msg {

/** struct Tip::Msg::Log
 *
 * @brief emitted by `Tip::log`.
 */
struct Log {
	Tip::LogLevel level;
	std::string message;
};

}}

#endif /* !defined(TIP_MSG_LOG_HPP) */
