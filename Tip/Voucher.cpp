#include"Tip/Voucher.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace Tip {

std::string CreationRequest::status_string(Status s) {
	switch (s) {
	case Pending: return "pending";
	case Complete: return "complete";
	case Expired: return "expired";
	}
	return "pending";
}

CreationRequest::Status CreationRequest::status_parse(std::string const& s) {
	if (s == "pending")
		return Pending;
	if (s == "complete")
		return Complete;
	if (s == "expired")
		return Expired;
	throw Util::BacktraceException<std::runtime_error>(
		"Tip::CreationRequest: unknown status in database: " + s
	);
}

}
