#ifndef LNURL_CODEC_HPP
#define LNURL_CODEC_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Lnurl {

/** Lnurl::EncodingError
 *
 * @brief thrown when a string cannot be encoded
 * as, or decoded from, an LNURL.
 */
class EncodingError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	EncodingError(std::string const& e
		     ) : Util::BacktraceException<std::runtime_error>(
				"Lnurl: " + e
			 ) { }
};

/** Lnurl::encode
 *
 * @brief bech32-encode the bytes of a URL under the
 * "lnurl" prefix.
 *
 * @return the uppercase form, which always starts
 * with "LNURL1".
 */
std::string encode(std::string const& url);

/** Lnurl::decode
 *
 * @brief recover the URL from an LNURL string in
 * either case.
 *
 * @desc Throws `Lnurl::EncodingError` if the
 * checksum does not verify, the prefix is not
 * "lnurl", or the data leaves non-zero padding.
 */
std::string decode(std::string const& lnurl);

}

#endif /* !defined(LNURL_CODEC_HPP) */
