#ifndef UTIL_BECH32_HPP
#define UTIL_BECH32_HPP

#include<cstdint>
#include<string>
#include<vector>

namespace Util { namespace Bech32 {

/** Util::Bech32::encode
 *
 * @brief encode 5-bit values under the given
 * human-readable part, appending the 6-symbol
 * checksum.
 *
 * @desc The output is lowercase; every value must
 * be below 32.
 *
 * @return false if a value does not fit in 5 bits.
 */
bool encode( std::string& bech32
	   , std::string const& hrp
	   , std::vector<std::uint8_t> const& values
	   );

/** Util::Bech32::decode
 *
 * @brief decode a bech32 string into its
 * human-readable part and its 5-bit values,
 * checksum removed.
 *
 * @return true if decoding succeeded and the
 * checksum verified.
 *
 * @desc The input is lowercased first.
 * There is no length limit, as LNURLs routinely
 * exceed the 90 characters of BIP173.
 */
bool decode( std::string& hrp
	   , std::vector<std::uint8_t>& values
	   , std::string const& bech32
	   );

/** Util::Bech32::convert_bits
 *
 * @brief regroup a sequence of `from`-bit values
 * into `to`-bit values.
 *
 * @desc When `pad` is set, leftover bits are padded
 * with zeros into a final value.
 * Otherwise leftover bits must be fewer than `from`
 * and all zero.
 *
 * @return false if a value does not fit in `from`
 * bits, or the leftover bits are invalid.
 */
bool convert_bits( std::vector<std::uint8_t>& out
		 , std::vector<std::uint8_t> const& in
		 , unsigned int from
		 , unsigned int to
		 , bool pad
		 );

}}

#endif /* !defined(UTIL_BECH32_HPP) */
