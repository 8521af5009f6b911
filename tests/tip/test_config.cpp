#undef NDEBUG
#include"Tip/Config.hpp"
#include<assert.h>

namespace {

bool rejects(std::string const& arg) {
	auto config = Tip::Config();
	try {
		config.set_argument(arg);
	} catch (Tip::ConfigError const& _) {
		return true;
	}
	return false;
}

}

int main() {
	auto config = Tip::Config();
	assert(config.base_url == "http://localhost:8080");
	assert(config.port == 8080);
	assert(config.fee_per_voucher_sats == 10);
	assert(config.max_vouchers == 10);
	assert(config.funding_fee_min == Ln::Amount::msat(2000));
	assert(config.funding_fee_percent == 0.004);
	assert(config.min_sendable == Ln::Amount::sat(100));
	assert(config.max_sendable == Ln::Amount::sat(200000));
	assert(config.confirm_timeout == 3600);
	assert(config.refund_interval == 86400);
	assert(config.log_level == Tip::Info);

	config.set_argument("--base-url=https://tip.example///");
	assert(config.base_url == "https://tip.example");
	config.set_argument("--port=9000");
	assert(config.port == 9000);
	config.set_argument("--max-vouchers=50");
	assert(config.max_vouchers == 50);
	config.set_argument("--funding-fee-min-msats=0");
	assert(config.funding_fee_min == Ln::Amount::msat(0));
	config.set_argument("--funding-fee-percent=0.01");
	assert(config.funding_fee_percent == 0.01);
	config.set_argument("--gateway-token=");
	assert(config.gateway_token.empty());
	config.set_argument("--gateway-token=a=b");
	assert(config.gateway_token == "a=b");
	config.set_argument("--log-level=debug");
	assert(config.log_level == Tip::Debug);
	config.set_argument("--min-sendable-sats=1");
	assert(config.min_sendable == Ln::Amount::sat(1));

	assert(rejects("--nope=1"));
	assert(rejects("--port"));
	assert(rejects("port=1"));
	assert(rejects("--port=0"));
	assert(rejects("--port=65536"));
	assert(rejects("--port=-1"));
	assert(rejects("--port=80x"));
	assert(rejects("--max-vouchers=0"));
	assert(rejects("--base-url=ftp://x"));
	assert(rejects("--gateway-url=localhost:3000"));
	assert(rejects("--funding-fee-percent=1"));
	assert(rejects("--funding-fee-percent=-0.1"));
	assert(rejects("--poll-interval=0"));
	assert(rejects("--refund-interval=abc"));
	assert(rejects("--log-level=loud"));
	assert(rejects("--db="));
	assert(rejects("--min-sendable-sats=300000"));

	assert(Tip::Config::usage().find("--base-url=URL") != std::string::npos);

	auto l = Tip::Info;
	assert(Tip::log_level_parse(l, "warn"));
	assert(l == Tip::Warn);
	assert(!Tip::log_level_parse(l, "WARN2"));
	assert(l == Tip::Warn);
	assert(Tip::log_level_name(Tip::Error) == "ERROR");

	return 0;
}
