#ifndef TIP_LINKS_HPP
#define TIP_LINKS_HPP

#include<string>

class Uuid;

namespace Tip {

/* `base_url` has no trailing slash.  */
std::string pay_url(std::string const& base_url, Uuid const& pay_id);
std::string withdraw_url( std::string const& base_url
			, Uuid const& withdraw_id
			);

/** Tip::info_url
 *
 * @brief where a browser can look at the
 * voucher behind `url`: the voucher info
 * endpoint, given `url` as an LNURL.
 */
std::string info_url( std::string const& base_url
		    , std::string const& url
		    );

}

#endif /* !defined(TIP_LINKS_HPP) */
