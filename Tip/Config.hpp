#ifndef TIP_CONFIG_HPP
#define TIP_CONFIG_HPP

#include"Ln/Amount.hpp"
#include"Tip/log.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>

namespace Tip {

/** Tip::ConfigError
 *
 * @brief thrown on an unknown option or an
 * unusable option value.
 */
class ConfigError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	ConfigError(std::string const& e
		   ) : Util::BacktraceException<std::runtime_error>(e) { }
};

/** struct Tip::Config
 *
 * @brief every setting of the service.
 * Default-constructed with the defaults.
 */
struct Config {
	/* Public base URL, without a trailing slash.  */
	std::string base_url;
	std::string listen;
	std::uint16_t port;
	std::string db;

	std::string gateway_url;
	/* Empty means no Authorization header.  */
	std::string gateway_token;

	std::uint64_t fee_per_voucher_sats;
	std::uint32_t max_vouchers;

	Ln::Amount funding_fee_min;
	double funding_fee_percent;

	/* Seconds.  */
	double absolute_expiry;
	double default_relative_expiry;

	Ln::Amount min_sendable;
	Ln::Amount max_sendable;

	/* Seconds.  */
	double confirm_timeout;
	double poll_interval;
	double refund_interval;

	Tip::LogLevel log_level;

	Config();

	/** Tip::Config::set
	 *
	 * @brief sets the option `name` (without the
	 * leading `--`) from its text.
	 * Throws `Tip::ConfigError` on an unknown name
	 * or a bad value.
	 */
	void set(std::string const& name, std::string const& value);

	/** Tip::Config::set_argument
	 *
	 * @brief handles one `--name=value` command
	 * line argument.
	 */
	void set_argument(std::string const& arg);

	/* Lines of the `--help` option listing.  */
	static std::string usage();
};

}

#endif /* !defined(TIP_CONFIG_HPP) */
