#include"Lnurl/K1.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include<algorithm>
#include<sodium.h>
#include<stdexcept>

namespace Lnurl {

K1 K1::random() {
	auto rv = K1();
	rv.pimpl = Util::make_unique<Impl>();
	randombytes_buf(rv.pimpl->data, sizeof(rv.pimpl->data));
	return rv;
}

bool K1::operator==(K1 const& o) const {
	if (!pimpl || !o.pimpl)
		return !pimpl && !o.pimpl;
	return sodium_memcmp(pimpl->data, o.pimpl->data, 32) == 0;
}

K1::operator std::string() const {
	if (!pimpl)
		return "";
	return Util::Str::hexdump(pimpl->data, 32);
}
K1::K1(std::string const& s) {
	if (!valid_string(s))
		throw std::invalid_argument("Lnurl::K1: invalid input string.");
	pimpl = Util::make_unique<Impl>();
	auto buf = Util::Str::hexread(s);
	std::copy(buf.begin(), buf.end(), pimpl->data);
}
bool K1::valid_string(std::string const& s) {
	return Util::Str::ishex(s) && s.size() == 64;
}

}
