#ifndef TIP_MOD_VOUCHERINFO_HPP
#define TIP_MOD_VOUCHERINFO_HPP

#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Http { class Router; }
namespace Http { struct Request; }
namespace Http { struct Response; }
namespace S { class Bus; }
namespace Tip { class Store; }

namespace Tip { namespace Mod {

/** class Tip::Mod::VoucherInfo
 *
 * @brief `GET /api/vouchers/info?lightning=`
 * describes the voucher behind a pay or
 * withdraw LNURL.
 */
class VoucherInfo {
private:
	S::Bus& bus;
	Tip::Store& store;

	void start(Http::Router& router);

	Ev::Io<Http::Response> info(Http::Request req);

public:
	VoucherInfo( S::Bus& bus_
		   , Http::Router& router
		   , Tip::Store& store_
		   ) : bus(bus_), store(store_) {
		start(router);
	}

	/** Tip::Mod::VoucherInfo::path_segments
	 *
	 * @brief the non-empty `/`-separated segments
	 * of the path of `url`, ignoring its scheme,
	 * host, query and fragment.
	 */
	static
	std::vector<std::string> path_segments(std::string const& url);
};

}}

#endif /* !defined(TIP_MOD_VOUCHERINFO_HPP) */
