#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include"Uuid.hpp"
#include<algorithm>
#include<sodium.h>
#include<stdexcept>

namespace {

std::uint8_t const zero[] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0};

}

Uuid Uuid::random() {
	auto rv = Uuid();
	rv.pimpl = Util::make_unique<Impl>();
	randombytes_buf(rv.pimpl->data, sizeof(rv.pimpl->data));
	return rv;
}

bool Uuid::operator==(Uuid const& o) const {
	auto a = pimpl ? pimpl->data : zero;
	auto b = o.pimpl ? o.pimpl->data : zero;
	return sodium_memcmp(a, b, 16) == 0;
}

Uuid::operator bool() const {
	if (!pimpl)
		return false;
	return sodium_memcmp(pimpl->data, zero, 16) != 0;
}

Uuid::operator std::string() const {
	if (!pimpl)
		return "00000000000000000000000000000000";
	return Util::Str::hexdump(pimpl->data, 16);
}
Uuid::Uuid(std::string const& s) {
	pimpl = Util::make_unique<Impl>();
	if (!valid_string(s))
		throw std::invalid_argument("Uuid: invalid input string.");
	auto buf = Util::Str::hexread(s);
	if (buf.size() != 16)
		throw std::invalid_argument("Uuid: invalid input string.");
	std::copy(buf.begin(), buf.end(), pimpl->data);
}
bool Uuid::valid_string(std::string const& s) {
	return Util::Str::ishex(s) && s.size() == 32;
}
