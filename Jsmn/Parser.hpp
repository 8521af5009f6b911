#ifndef JSMN_PARSER_HPP
#define JSMN_PARSER_HPP

#include<memory>
#include<string>
#include<vector>

namespace Jsmn { class Object; }

namespace Jsmn {

/* A stateful jsmn-based parser.
 *
 * If previously-fed data into this parser is not a complete
 * JSON datum, then the feed() member function will return an
 * empty vector.
 * Subsequent feed() calls will append their argument to any
 * incomplete datum until at least one complete datum is
 * formed.
 */
class Parser {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Parser();
	~Parser();

	Parser(Parser const&) =delete;
	Parser(Parser&&) =delete;

	/* Feeds a string into this parser.  */
	std::vector<Jsmn::Object> feed(std::string const& s);
};

}

#endif /* !defined(JSMN_PARSER_HPP) */
