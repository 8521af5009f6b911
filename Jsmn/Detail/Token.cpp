#include"Jsmn/Detail/Token.hpp"

namespace Jsmn { namespace Detail {

/* Advance past the given token and all of its children.  */
void Token::next(Token const*& tokptr) {
	auto remaining = 1;
	while (remaining > 0) {
		remaining += tokptr->size;
		++tokptr;
		--remaining;
	}
}

}}
