#include"Jsmn/Object.hpp"
#include"Ln/Amount.hpp"
#include<algorithm>
#include<sstream>
#include<stdexcept>

namespace Ln {

bool Amount::valid_object(Jsmn::Object const& o) {
	if (!o.is_number())
		return false;
	auto text = o.direct_text();
	/* 21,000,000 BTC in msat is 19 digits.  */
	if (text.empty() || text.size() > 19)
		return false;
	return std::all_of( text.begin(), text.end()
			  , [](char c) { return '0' <= c && c <= '9'; }
			  );
}

Amount Amount::object(Jsmn::Object const& o) {
	if (!valid_object(o))
		throw std::invalid_argument("Ln::Amount json object invalid.");
	auto is = std::istringstream(o.direct_text());
	auto ret = Amount();
	is >> ret.v;
	return ret;
}

Amount::operator std::string() const {
	auto os = std::ostringstream();
	os << v << "msat";
	return os.str();
}

}
