#include"Lnurl/codec.hpp"
#include"Tip/links.hpp"
#include"Uuid.hpp"

namespace Tip {

std::string pay_url(std::string const& base_url, Uuid const& pay_id) {
	return base_url + "/pay/" + std::string(pay_id);
}
std::string withdraw_url( std::string const& base_url
			, Uuid const& withdraw_id
			) {
	return base_url + "/withdraw/" + std::string(withdraw_id);
}

std::string info_url( std::string const& base_url
		    , std::string const& url
		    ) {
	return base_url + "/api/vouchers/info?lightning="
	     + Lnurl::encode(url)
	     ;
}

}
