#include"Lnurl/codec.hpp"
#include"Util/Bech32.hpp"
#include<algorithm>
#include<ctype.h>
#include<cstdint>
#include<vector>

namespace {

auto const hrp = std::string("lnurl");

}

namespace Lnurl {

std::string encode(std::string const& url) {
	auto bytes = std::vector<std::uint8_t>(url.begin(), url.end());
	auto values = std::vector<std::uint8_t>();
	if (!Util::Bech32::convert_bits(values, bytes, 8, 5, true))
		throw EncodingError("cannot regroup URL into 5-bit values");

	auto ret = std::string();
	if (!Util::Bech32::encode(ret, hrp, values))
		throw EncodingError("value out of range for bech32");

	std::transform( ret.begin(), ret.end(), ret.begin()
		      , [](char c) { return char(toupper((unsigned char) c)); }
		      );
	return ret;
}

std::string decode(std::string const& lnurl) {
	auto my_hrp = std::string();
	auto values = std::vector<std::uint8_t>();
	if (!Util::Bech32::decode(my_hrp, values, lnurl))
		throw EncodingError("invalid bech32 string or checksum");
	if (my_hrp != hrp)
		throw EncodingError("unexpected prefix: " + my_hrp);

	auto bytes = std::vector<std::uint8_t>();
	if (!Util::Bech32::convert_bits(bytes, values, 5, 8, false))
		throw EncodingError("invalid padding in bit conversion");
	return std::string(bytes.begin(), bytes.end());
}

}
