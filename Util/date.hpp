#ifndef UTIL_DATE_HPP
#define UTIL_DATE_HPP

#include<string>

namespace Util {

/** Util::date
 *
 * @brief Returns a simple date representation
 * of the given Unix Epoch time, with milliseconds,
 * for log lines.
 */
std::string date(double epoch);

/** Util::rfc3339
 *
 * @brief Returns the given Unix Epoch time as an
 * RFC 3339 UTC timestamp with whole seconds, e.g.
 * "2026-01-02T03:04:05Z".
 */
std::string rfc3339(double epoch);

}

#endif /* !defined(UTIL_DATE_HPP) */
