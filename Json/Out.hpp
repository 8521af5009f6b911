#ifndef JSON_OUT_HPP
#define JSON_OUT_HPP

#include"Jsmn/Detail/Str.hpp"
#include<cstddef>
#include<cstdint>
#include<iomanip>
#include<memory>
#include<sstream>

namespace Json { class Out; }

namespace Json { namespace Detail {

char const begin_obj = '{';
char const end_obj = '}';
char const begin_arr = '[';
char const end_arr = ']';

/* Pre-declare these.  */
typedef std::stringstream Content;
template<typename Up> class Array;
template<typename Up> class Detail;

/* Simple type serialization.  */
template<typename t>
struct Serializer;
template<>
struct Serializer<double> {
	static std::string serialize(double v) {
		return Jsmn::Detail::Str::from_double(v);
	}
};
/* Integers are written in decimal, widened so that
 * char-sized types are not written as characters.  */
template<typename Wide, typename t>
struct IntSerializer {
	static std::string serialize(t v) {
		auto os = std::ostringstream();
		os << std::dec << Wide(v);
		return os.str();
	}
};
template<>
struct Serializer<std::int32_t>
	: public IntSerializer<std::int64_t, std::int32_t> { };
template<>
struct Serializer<std::int64_t>
	: public IntSerializer<std::int64_t, std::int64_t> { };
template<>
struct Serializer<std::uint32_t>
	: public IntSerializer<std::uint64_t, std::uint32_t> { };
template<>
struct Serializer<std::uint64_t>
	: public IntSerializer<std::uint64_t, std::uint64_t> { };
template<>
struct Serializer<bool> {
	static std::string serialize(bool v) {
		return v ? "true" : "false";
	}
};
template<>
struct Serializer<std::string> {
	static std::string serialize(std::string const& v) {
		return "\"" + Jsmn::Detail::Str::to_escaped(v) + "\"";
	}
};
template<std::size_t n>
struct Serializer<char [n]> {
	static std::string serialize(char const v[n]) {
		return "\"" + Jsmn::Detail::Str::to_escaped(v) + "\"";
	}
};
template<>
struct Serializer<std::nullptr_t> {
	static std::string serialize(std::nullptr_t) {
		return "null";
	}
};

template<typename Up>
class Object {
private:
	Up& up;
	Content& content;
	bool started;

	void encomma() {
		if (started)
			content << ", ";
		else
			started = true;
	}

public:
	Object(Up& up_, Content& content_) : up(up_), content(content_) {
		started = false;
		content << begin_obj;
	}

	template<typename a>
	Object<Up>& field(std::string const& name, a const& value) {
		encomma();
		content << Serializer<std::string>::serialize(name)
			<< ": "
			<< Serializer<a>::serialize(value)
			;
		return *this;
	}

	/* Declared later when all types are completed.  */
	Array<Object<Up>> start_array(std::string const& field);

	Up& end_object() {
		content << end_obj;
		return up;
	}
};

template<typename Up>
class Array {
private:
	Up& up;
	Content& content;
	bool started;

	void encomma() {
		if (started)
			content << ", ";
		else
			started = true;
	}

public:
	Array(Up& up_, Content& content_) : up(up_), content(content_) {
		started = false;
		content << begin_arr;
	}

	template<typename a>
	Array<Up>& entry(a const& value) {
		encomma();
		content << Serializer<a>::serialize(value);
		return *this;
	}

	/* Declared later when all types are completed.  */
	Array<Array<Up>> start_array();
	Object<Array<Up>> start_object();

	Up& end_array() {
		content << end_arr;
		return up;
	}
};

} /* namespace Detail */

class Out {
private:
	std::shared_ptr<Json::Detail::Content> content;

public:
	Out() : content(std::make_shared<Json::Detail::Content>()) { }

	std::string output() const {
		return content->str();
	}

	Json::Detail::Object<Json::Out> start_object() {
		return Json::Detail::Object<Json::Out>(*this, *content);
	}
	Json::Detail::Array<Json::Out> start_array() {
		return Json::Detail::Array<Json::Out>(*this, *content);
	}
};

namespace Detail {

/* Sub-objects and sub-arrays.  */
template<typename Up>
Array<Object<Up>> Object<Up>::start_array(std::string const& name) {
	encomma();
	content << Serializer<std::string>::serialize(name)
		<< ": "
		;
	return Array<Object<Up>>(*this, content);
}
template<typename Up>
Array<Array<Up>> Array<Up>::start_array() {
	encomma();
	return Array<Array<Up>>(*this, content);
}
template<typename Up>
Object<Array<Up>> Array<Up>::start_object() {
	encomma();
	return Object<Array<Up>>(*this, content);
}

} /* namespace Detail */

} /* namespace Json */

#endif /* !defined(JSON_OUT_HPP) */
