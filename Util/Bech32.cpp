#include"Util/Bech32.hpp"
#include<algorithm>
#include<ctype.h>

namespace {

auto const bech32_chars = std::string("qpzry9x8gf2tvdw0s3jn54khce6mua7l");

std::uint32_t const generator[] =
{ 0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3 };

std::size_t const checksum_length = 6;

int decode_char(char c) {
	auto it = std::find(bech32_chars.begin(), bech32_chars.end(), c);
	if (it == bech32_chars.end())
		return -1;
	return it - bech32_chars.begin();
}

std::uint32_t polymod(std::vector<std::uint8_t> const& values) {
	auto chk = std::uint32_t(1);
	for (auto v : values) {
		auto top = chk >> 25;
		chk = ((chk & 0x1ffffff) << 5) ^ std::uint32_t(v);
		for (auto i = 0; i < 5; ++i)
			if ((top >> i) & 1)
				chk ^= generator[i];
	}
	return chk;
}

/* High bits of each character, a zero separator, then the
 * low bits of each character.  */
std::vector<std::uint8_t> hrp_expand(std::string const& hrp) {
	auto ret = std::vector<std::uint8_t>();
	ret.reserve(hrp.size() * 2 + 1);
	for (auto c : hrp)
		ret.push_back(std::uint8_t(c) >> 5);
	ret.push_back(0);
	for (auto c : hrp)
		ret.push_back(std::uint8_t(c) & 31);
	return ret;
}

}

namespace Util { namespace Bech32 {

bool encode( std::string& bech32
	   , std::string const& hrp
	   , std::vector<std::uint8_t> const& values
	   ) {
	auto checked = hrp_expand(hrp);
	checked.insert(checked.end(), values.begin(), values.end());
	checked.insert(checked.end(), checksum_length, 0);
	auto pm = polymod(checked) ^ 1;

	auto all = values;
	for (auto i = std::size_t(0); i < checksum_length; ++i)
		all.push_back((pm >> (5 * (checksum_length - 1 - i))) & 31);

	auto ret = hrp + "1";
	for (auto v : all) {
		if (v >= bech32_chars.size())
			return false;
		ret.push_back(bech32_chars[v]);
	}
	bech32 = std::move(ret);
	return true;
}

bool decode( std::string& hrp
	   , std::vector<std::uint8_t>& values
	   , std::string const& bech32
	   ) {
	auto lower = bech32;
	std::transform( lower.begin(), lower.end(), lower.begin()
		      , [](char c) { return char(tolower((unsigned char) c)); }
		      );

	auto sep = lower.rfind('1');
	if (sep == std::string::npos || sep == 0)
		return false;
	if (lower.size() - (sep + 1) < checksum_length)
		return false;

	auto my_hrp = lower.substr(0, sep);
	auto my_values = std::vector<std::uint8_t>();
	for (auto i = sep + 1; i < lower.size(); ++i) {
		auto v = decode_char(lower[i]);
		if (v < 0)
			return false;
		my_values.push_back(std::uint8_t(v));
	}

	auto checked = hrp_expand(my_hrp);
	checked.insert(checked.end(), my_values.begin(), my_values.end());
	if (polymod(checked) != 1)
		return false;

	my_values.resize(my_values.size() - checksum_length);
	hrp = std::move(my_hrp);
	values = std::move(my_values);
	return true;
}

bool convert_bits( std::vector<std::uint8_t>& out
		 , std::vector<std::uint8_t> const& in
		 , unsigned int from
		 , unsigned int to
		 , bool pad
		 ) {
	auto acc = std::uint32_t(0);
	auto bits = 0u;
	auto const maxv = (std::uint32_t(1) << to) - 1;
	auto ret = std::vector<std::uint8_t>();
	for (auto v : in) {
		if ((std::uint32_t(v) >> from) != 0)
			return false;
		/* Only the low bits still waiting matter.  */
		acc = ((acc << from) | v) & ((std::uint32_t(1) << (from + to)) - 1);
		bits += from;
		while (bits >= to) {
			bits -= to;
			ret.push_back((acc >> bits) & maxv);
		}
	}
	if (pad) {
		if (bits > 0)
			ret.push_back((acc << (to - bits)) & maxv);
	} else if (bits >= from || ((acc << (to - bits)) & maxv) != 0) {
		return false;
	}
	out = std::move(ret);
	return true;
}

}}
