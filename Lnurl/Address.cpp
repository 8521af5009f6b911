#include"Lnurl/Address.hpp"

namespace {

bool is_alpha(char c) {
	return ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z');
}
bool is_alnum(char c) {
	return is_alpha(c) || ('0' <= c && c <= '9');
}

bool valid_user(std::string const& s) {
	if (s.empty())
		return false;
	for (auto c : s) {
		if (is_alnum(c))
			continue;
		switch (c) {
		case '.': case '_': case '%': case '+': case '-':
			continue;
		}
		return false;
	}
	return true;
}

bool valid_domain(std::string const& s) {
	auto dot = s.rfind('.');
	if (dot == std::string::npos || dot == 0)
		return false;
	for (auto i = std::size_t(0); i < dot; ++i) {
		auto c = s[i];
		if (!is_alnum(c) && c != '.' && c != '-')
			return false;
	}
	auto tld = s.substr(dot + 1);
	if (tld.size() < 2)
		return false;
	for (auto c : tld)
		if (!is_alpha(c))
			return false;
	return true;
}

}

namespace Lnurl {

bool Address::valid_string(std::string const& text) {
	auto at = text.find('@');
	if (at == std::string::npos)
		return false;
	if (text.find('@', at + 1) != std::string::npos)
		return false;
	return valid_user(text.substr(0, at))
	    && valid_domain(text.substr(at + 1))
	     ;
}

Address::Address(std::string const& text) {
	if (!valid_string(text))
		throw AddressError(text);
	auto at = text.find('@');
	u = text.substr(0, at);
	d = text.substr(at + 1);
}

}
