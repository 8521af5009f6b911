#include"Tip/Config.hpp"
#include"Util/Str.hpp"
#include<cerrno>
#include<cstdlib>
#include<limits>
#include<sstream>

namespace {

std::uint64_t parse_count( std::string const& name
			 , std::string const& value
			 , std::uint64_t max = std::numeric_limits<std::uint64_t>::max()
			 ) {
	if (value.empty() || value[0] < '0' || value[0] > '9')
		throw Tip::ConfigError(Util::Str::fmt(
			"--%s: expected a non-negative integer, got \"%s\"",
			name.c_str(), value.c_str()
		));
	char* end = nullptr;
	errno = 0;
	auto rv = std::strtoull(value.c_str(), &end, 10);
	if (errno != 0 || *end != '\0' || rv > max)
		throw Tip::ConfigError(Util::Str::fmt(
			"--%s: value out of range: \"%s\"",
			name.c_str(), value.c_str()
		));
	return std::uint64_t(rv);
}

double parse_real( std::string const& name
		 , std::string const& value
		 ) {
	char* end = nullptr;
	errno = 0;
	auto rv = std::strtod(value.c_str(), &end);
	if (value.empty() || errno != 0 || *end != '\0' || !(rv >= 0))
		throw Tip::ConfigError(Util::Str::fmt(
			"--%s: expected a non-negative number, got \"%s\"",
			name.c_str(), value.c_str()
		));
	return rv;
}

double parse_positive( std::string const& name
		     , std::string const& value
		     ) {
	auto rv = parse_real(name, value);
	if (rv == 0)
		throw Tip::ConfigError(Util::Str::fmt(
			"--%s: must be positive", name.c_str()
		));
	return rv;
}

std::string parse_url( std::string const& name
		     , std::string const& value
		     ) {
	if ( value.compare(0, 7, "http://") != 0
	  && value.compare(0, 8, "https://") != 0
	   )
		throw Tip::ConfigError(Util::Str::fmt(
			"--%s: expected an http:// or https:// URL, got \"%s\"",
			name.c_str(), value.c_str()
		));
	auto rv = value;
	while (!rv.empty() && rv.back() == '/')
		rv.pop_back();
	return rv;
}

}

namespace Tip {

Config::Config()
	: base_url("http://localhost:8080")
	, listen("0.0.0.0")
	, port(8080)
	, db("./tipme.db")
	, gateway_url("http://localhost:3000")
	, gateway_token("")
	, fee_per_voucher_sats(10)
	, max_vouchers(10)
	, funding_fee_min(Ln::Amount::msat(2000))
	, funding_fee_percent(0.004)
	, absolute_expiry(31536000)
	, default_relative_expiry(2592000)
	, min_sendable(Ln::Amount::sat(100))
	, max_sendable(Ln::Amount::sat(200000))
	, confirm_timeout(3600)
	, poll_interval(2)
	, refund_interval(86400)
	, log_level(Tip::Info)
	{ }

void Config::set(std::string const& name, std::string const& value) {
	if (name == "base-url")
		base_url = parse_url(name, value);
	else if (name == "listen") {
		if (value.empty())
			throw ConfigError("--listen: empty address");
		listen = value;
	} else if (name == "port") {
		auto p = parse_count(name, value, 65535);
		if (p == 0)
			throw ConfigError("--port: must not be 0");
		port = std::uint16_t(p);
	} else if (name == "db") {
		if (value.empty())
			throw ConfigError("--db: empty path");
		db = value;
	} else if (name == "gateway-url")
		gateway_url = parse_url(name, value);
	else if (name == "gateway-token")
		gateway_token = value;
	else if (name == "fee-per-voucher-sats")
		fee_per_voucher_sats = parse_count(name, value, 21000000ULL * 100000000ULL);
	else if (name == "max-vouchers") {
		auto m = parse_count(name, value, 10000);
		if (m == 0)
			throw ConfigError("--max-vouchers: must not be 0");
		max_vouchers = std::uint32_t(m);
	} else if (name == "funding-fee-min-msats")
		funding_fee_min = Ln::Amount::msat(parse_count(name, value));
	else if (name == "funding-fee-percent") {
		funding_fee_percent = parse_real(name, value);
		if (funding_fee_percent >= 1)
			throw ConfigError("--funding-fee-percent: must be below 1");
	} else if (name == "absolute-expiry")
		absolute_expiry = parse_real(name, value);
	else if (name == "default-relative-expiry")
		default_relative_expiry = parse_real(name, value);
	else if (name == "min-sendable-sats")
		min_sendable = Ln::Amount::sat(parse_count(name, value, 21000000ULL * 100000000ULL));
	else if (name == "max-sendable-sats")
		max_sendable = Ln::Amount::sat(parse_count(name, value, 21000000ULL * 100000000ULL));
	else if (name == "confirm-timeout")
		confirm_timeout = parse_real(name, value);
	else if (name == "poll-interval")
		poll_interval = parse_positive(name, value);
	else if (name == "refund-interval")
		refund_interval = parse_positive(name, value);
	else if (name == "log-level") {
		if (!Tip::log_level_parse(log_level, value))
			throw ConfigError(Util::Str::fmt(
				"--log-level: expected trace, debug, info, warn or error, got \"%s\"",
				value.c_str()
			));
	} else
		throw ConfigError(Util::Str::fmt(
			"Unrecognized option: --%s", name.c_str()
		));

	if (min_sendable > max_sendable)
		throw ConfigError("--min-sendable-sats is above --max-sendable-sats");
}

void Config::set_argument(std::string const& arg) {
	if (arg.size() < 3 || arg[0] != '-' || arg[1] != '-')
		throw ConfigError("Unrecognized argument: " + arg);
	auto eq = arg.find('=');
	if (eq == std::string::npos)
		throw ConfigError("Option needs a value: " + arg);
	set(arg.substr(2, eq - 2), arg.substr(eq + 1));
}

std::string Config::usage() {
	auto os = std::ostringstream();
	os << " --base-url=URL                 Public base URL used in LNURLs (http://localhost:8080)." << std::endl
	   << " --listen=ADDRESS               Address to listen on (0.0.0.0)." << std::endl
	   << " --port=N                       Port to listen on (8080)." << std::endl
	   << " --db=PATH                      SQLite database file (./tipme.db)." << std::endl
	   << " --gateway-url=URL              Payment gateway REST base (http://localhost:3000)." << std::endl
	   << " --gateway-token=TOKEN          Bearer token for the payment gateway." << std::endl
	   << " --fee-per-voucher-sats=N       Creation fee per voucher (10)." << std::endl
	   << " --max-vouchers=N               Most vouchers per creation request (10)." << std::endl
	   << " --funding-fee-min-msats=N      Minimum fee kept from each funding (2000)." << std::endl
	   << " --funding-fee-percent=X        Proportional fee kept from each funding (0.004)." << std::endl
	   << " --absolute-expiry=SECONDS      Voucher lifetime after creation (31536000)." << std::endl
	   << " --default-relative-expiry=SECONDS" << std::endl
	   << "                                Voucher lifetime after funding (2592000)." << std::endl
	   << " --min-sendable-sats=N          LNURL-Pay minimum (100)." << std::endl
	   << " --max-sendable-sats=N          LNURL-Pay maximum (200000)." << std::endl
	   << " --confirm-timeout=SECONDS      How long to wait for a payment (3600)." << std::endl
	   << " --poll-interval=SECONDS        Payment status polling interval (2)." << std::endl
	   << " --refund-interval=SECONDS      Period of the refund sweep (86400)." << std::endl
	   << " --log-level=LEVEL              trace, debug, info, warn or error (info)." << std::endl
	   ;
	return os.str();
}

}
