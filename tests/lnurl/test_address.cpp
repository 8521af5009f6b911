#undef NDEBUG
#include"Lnurl/Address.hpp"
#include<assert.h>

int main() {
	auto a = Lnurl::Address("alice@example.com");
	assert(a.user() == "alice");
	assert(a.domain() == "example.com");
	assert(std::string(a) == "alice@example.com");
	assert(a.well_known_url() == "https://example.com/.well-known/lnurlp/alice");

	assert(Lnurl::Address::valid_string("first.last+tips_1%x-y@sub.domain-x.io"));
	assert(Lnurl::Address::valid_string("A@B.CO"));

	assert(!Lnurl::Address::valid_string(""));
	assert(!Lnurl::Address::valid_string("alice"));
	assert(!Lnurl::Address::valid_string("@example.com"));
	assert(!Lnurl::Address::valid_string("alice@"));
	assert(!Lnurl::Address::valid_string("alice@example"));
	assert(!Lnurl::Address::valid_string("alice@example.c"));
	assert(!Lnurl::Address::valid_string("alice@example.c0m"));
	assert(!Lnurl::Address::valid_string("alice@.com"));
	assert(!Lnurl::Address::valid_string("a@b@example.com"));
	assert(!Lnurl::Address::valid_string("al ice@example.com"));
	assert(!Lnurl::Address::valid_string("alice@exa/mple.com"));

	auto flag = false;
	try {
		(void) Lnurl::Address("nobody");
	} catch (Lnurl::AddressError const& e) {
		flag = true;
		assert(std::string(e.what()) == "invalid lightning address: nobody");
	}
	assert(flag);

	return 0;
}
