#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include<assert.h>
#include<string>

namespace {

bool parse_fails(std::string const& text) {
	try {
		(void) Jsmn::Object::parse_json(text);
	} catch (Jsmn::ParseError const&) {
		return true;
	}
	return false;
}

}

int main() {
	Jsmn::Parser p;

	/* A gateway response arriving in pieces.  */
	{
		auto res = p.feed(R"JSON({"payment_hash": "ab)JSON");
		assert(res.size() == 0);
	}
	{
		auto res = p.feed(R"JSON(cd", "bolt11": "lnbc1)JSON");
		assert(res.size() == 0);
	}
	{
		auto res = p.feed(R"JSON(0n1"}
)JSON");
		assert(res.size() == 1);
		assert(res[0].is_object());
		assert(std::string(res[0]["payment_hash"]) == "abcd");
		assert(std::string(res[0]["bolt11"]) == "lnbc10n1");
		assert(!res[0].has("amount"));
		assert(res[0]["amount"].is_null());
	}

	/* Numbers need a separator before they complete.  */
	{
		auto res = p.feed("1000");
		assert(res.size() == 0);
	}
	{
		auto res = p.feed("00 ");
		assert(res.size() == 1);
		assert(res[0].is_number());
		assert(double(res[0]) == 100000);
	}

	/* JSON text inside a JSON string.  */
	{
		auto res = p.feed(R"JSON(
			{"reason": "{\"status\": \"ERROR\"}", "ok": false}
		)JSON");
		assert(res.size() == 1);
		assert(std::string(res[0]["reason"])
		    == "{\"status\": \"ERROR\"}");
		assert(res[0]["ok"].is_boolean());
		assert(!bool(res[0]["ok"]));
	}

	/* A typical LNURL-pay response.  */
	{
		auto js = Jsmn::Object::parse_json(R"JSON(
		{ "tag": "payRequest"
		, "callback": "https://example.com/lnurlp/cb"
		, "minSendable": 1000
		, "maxSendable": 100000000000
		, "metadata": "[[\"text/plain\", \"tip\"]]"
		}
		)JSON");
		assert(js.is_object());
		assert(js.size() == 5);
		assert(js.keys().size() == 5);
		assert(std::string(js["tag"]) == "payRequest");
		assert(double(js["minSendable"]) == 1000);
		assert(double(js["maxSendable"]) == 100000000000.0);

		/* The metadata is itself JSON.  */
		auto md = Jsmn::Object::parse_json(std::string(js["metadata"]));
		assert(md.is_array());
		assert(md.size() == 1);
		assert(md[0].size() == 2);
		assert(std::string(md[0][0]) == "text/plain");
		assert(md[0][1].is_string());
		assert(md[5].is_null());

		for (auto i = std::size_t(0); i < md[0].size(); ++i)
			assert(md[0][i].is_string());
	}

	/* Conversions to the wrong type throw.  */
	{
		auto js = Jsmn::Object::parse_json(R"JSON({"pr": 42})JSON");
		auto thrown = false;
		try {
			(void) std::string(js["pr"]);
		} catch (Jsmn::TypeError const&) {
			thrown = true;
		}
		assert(thrown);
		thrown = false;
		try {
			(void) double(js["missing"]);
		} catch (Jsmn::TypeError const&) {
			thrown = true;
		}
		assert(thrown);
	}

	/* A bare literal is a complete datum.  */
	assert(Jsmn::Object::parse_json("true").is_boolean());
	assert(Jsmn::Object::parse_json(" 7 ").is_number());

	/* parse_json wants exactly one complete datum.  */
	assert(parse_fails(""));
	assert(parse_fails("   "));
	assert(parse_fails("{\"status\": \"OK\""));
	assert(parse_fails("[1] [2]"));
	assert(parse_fails("{\"a\": 1]"));
	assert(parse_fails("<html>502 Bad Gateway</html>"));

	return 0;
}
