#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include<assert.h>
#include<cstdint>
#include<string>

int main() {
	{
		auto s = Json::Out()
			.start_object()
				.field("status", std::string("ERROR"))
				.field("reason", std::string("voucher \"x\" not found"))
			.end_object()
			.output()
			;
		assert(s == "{\"status\": \"ERROR\", \"reason\": \"voucher \\\"x\\\" not found\"}");

		auto js = Jsmn::Object::parse_json(s);
		assert(std::string(js["reason"]) == "voucher \"x\" not found");
	}

	{
		/* Amounts in millisatoshi exceed 32 bits.  */
		auto s = Json::Out()
			.start_object()
				.field("minWithdrawable", std::uint64_t(1000))
				.field("maxWithdrawable", std::uint64_t(100000000000ULL))
				.field("count", std::int32_t(-3))
				.field("active", true)
				.field("last_funded_at", nullptr)
			.end_object()
			.output()
			;
		assert(s == "{\"minWithdrawable\": 1000"
			    ", \"maxWithdrawable\": 100000000000"
			    ", \"count\": -3"
			    ", \"active\": true"
			    ", \"last_funded_at\": null}");
	}

	{
		auto js = Json::Out();
		auto obj = js.start_object();
		obj.field("status", std::string("complete"));
		auto arr = obj.start_array("vouchers");
		for (auto i = 0; i < 3; ++i) {
			arr.start_object()
				.field("index", std::int32_t(i))
			.end_object();
		}
		arr.end_array();
		obj.start_array("metadata")
			.start_array()
				.entry(std::string("text/plain"))
				.entry(std::string("Tip via TipMe"))
			.end_array()
		.end_array();
		obj.end_object();

		auto s = js.output();
		auto parsed = Jsmn::Object::parse_json(s);
		assert(parsed["vouchers"].size() == 3);
		for (auto i = 0; i < 3; ++i)
			assert(double(parsed["vouchers"][i]["index"]) == i);
		assert(std::string(parsed["metadata"][0][1]) == "Tip via TipMe");
		assert(s.find("[[\"text/plain\", \"Tip via TipMe\"]]")
		    != std::string::npos);
	}

	return 0;
}
