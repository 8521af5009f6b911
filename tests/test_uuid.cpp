#undef NDEBUG
#include"Uuid.hpp"
#include<assert.h>
#include<sodium.h>

int main() {
	assert(sodium_init() >= 0);

	auto a = Uuid();
	auto b = Uuid();
	assert(a == b);
	assert(Uuid() == b);
	assert(!a);

	a = Uuid::random();
	assert(a); /* With very high probability, at least.  */
	assert(a != b);
	b = a;
	assert(a == b);

	b = (Uuid)(std::string)a;
	assert(a == b);
	assert(std::string(a).size() == 32);

	a = Uuid("00112233445566778899aabbccddeeff");
	b = Uuid("00112233445566778899AABBCCDDEEFF");
	assert(a == b);
	assert(std::string(a) == "00112233445566778899aabbccddeeff");

	b = Uuid("00112233445566778899aabbccddeefe");
	assert(a != b);

	/* Two fresh ones differ.  */
	assert(Uuid::random() != Uuid::random());

	assert(Uuid::valid_string("00112233445566778899aabbccddeeff"));
	assert(!Uuid::valid_string(""));
	assert(!Uuid::valid_string("00112233445566778899aabbccddeef"));
	assert(!Uuid::valid_string("00112233445566778899aabbccddeeff0"));
	assert(!Uuid::valid_string("0011223344556677-899aabbccddeeff"));
	assert(!Uuid::valid_string("../../../etc/passwd"));

	return 0;
}
