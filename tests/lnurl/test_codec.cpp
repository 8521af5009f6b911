#undef NDEBUG
#include"Lnurl/codec.hpp"
#include<assert.h>
#include<string>
#include<vector>

namespace {

auto const charset = std::string("QPZRY9X8GF2TVDW0S3JN54KHCE6MUA7L");

bool decode_fails(std::string const& s) {
	try {
		(void) Lnurl::decode(s);
	} catch (Lnurl::EncodingError const& _) {
		return true;
	}
	return false;
}

}

int main() {
	/* The example of the LNURL documentation.  */
	auto const url = std::string("https://service.com/api?q=3fc3645b439ce8e7f2553a69e5267081d96dcd340693afabe04be7b0ccd178df");
	auto const lnurl = std::string("LNURL1DP68GURN8GHJ7UM9WFMXJCM99E3K7MF0V9CXJ0M385EKVCENXC6R2C35XVUKXEFCV5MKVV34X5EKZD3EV56NYD3HXQURZEPEXEJXXEPNXSCRVWFNV9NXZCN9XQ6XYEFHVGCXXCMYXYMNSERXFQ5FNS");
	assert(Lnurl::encode(url) == lnurl);
	assert(Lnurl::decode(lnurl) == url);

	/* Either case decodes.  */
	{
		auto lower = lnurl;
		for (auto& c : lower)
			c = char(tolower((unsigned char) c));
		assert(Lnurl::decode(lower) == url);
	}

	/* A voucher URL.  */
	{
		auto pay = std::string("http://localhost:8080/pay/00112233445566778899aabbccddeeff");
		auto e = Lnurl::encode(pay);
		assert(e == "LNURL1DP68GUP69UHKCMMRV9KXSMMNWSARSVPCXQHHQCTE9UCRQVF3XGERXVE5XS6N2D3KXUMNSWPE89SKZCNZVD3KGER9V4NXV3MXC3X");
		assert(Lnurl::decode(e) == pay);
	}

	/* Arbitrary bytes, including the empty string
	 * and bytes above 0x7F.  */
	{
		auto samples = std::vector<std::string>{
			"",
			"a",
			std::string("\x00\x01\xff\x80", 4),
			"https://example.com/withdraw/ffeeddccbbaa99887766554433221100?x=1&y=2"
		};
		for (auto const& s : samples) {
			auto e = Lnurl::encode(s);
			assert(e.substr(0, 6) == "LNURL1");
			assert(Lnurl::decode(e) == s);
		}
		assert(Lnurl::encode("") == "LNURL13MYVSU");
	}

	/* Any single substituted character is caught.  */
	for (auto i = std::size_t(0); i < lnurl.size(); ++i) {
		if (i == 5)
			continue;
		auto c = lnurl[i];
		auto pos = charset.find(c);
		auto replacement = (pos == std::string::npos)
				 ? 'Q'
				 : charset[(pos + 1) % charset.size()]
				 ;
		auto mutated = lnurl;
		mutated[i] = replacement;
		assert(decode_fails(mutated));
	}

	/* Garbage.  */
	assert(decode_fails(""));
	assert(decode_fails("LNURL"));
	assert(decode_fails("LNURL1"));
	assert(decode_fails("LNURL1DP68GURN8GHJ7UM9WFMXJCM99E3K7MF0V9CXJ0M385EKVCENXC6R2C35XVUKXEFCV5MKVV34X5EKZD3EV56NYD3HXQURZEPEXEJXXEPNXSCRVWFNV9NXZCN9XQ6XYEFHVGCXXCMYXYMNSERXFQ5FNB"));
	assert(decode_fails("LNURL1DP68GURN8GHJ7UM9WFMXJCM99E3K7MF0V9CXJ0M385EKVCENXC6R2C35XVUKXEFCV5MKVV34X5EKZD3EV56NYD3HXQURZEPEXEJXXEPNXSCRVWFNV9NXZCN9XQ6XYEFHVGCXXCMYXYMNSERXFQ5FNO"));
	/* Bytes above 0x7F are simply not bech32.  */
	assert(decode_fails(std::string("LNURL1\xc3\xa9") + lnurl.substr(6)));
	assert(decode_fails(std::string("\xffNURL") + lnurl.substr(5)));
	assert(decode_fails(std::string(40, '\x80')));
	{
		auto mutated = lnurl;
		mutated[mutated.size() - 1] = '\xe9';
		assert(decode_fails(mutated));
	}
	/* Valid bech32, but not an LNURL.  */
	assert(decode_fails("A12UEL5L"));

	return 0;
}
