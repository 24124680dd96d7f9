/*
 *  Client interface for local Gree device access
 *
 *  Envelope codec: the `pack` field of every encrypted message is the
 *  inner JSON, PKCS7 padded, AES-128-ECB encrypted and base64 encoded.
 *
 *
 *  Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _greeCodec
#define _greeCodec

// Key used for scan replies and bind requests
#define GREE_GENERIC_KEY "a3K8Bx%2r8Y7#xDh"
#define GREE_KEY_SIZE 16

#include <string>

namespace Gree {
  namespace Codec {

	// Both return false when the key is not 16 bytes long, the base64 text
	// is invalid or the ciphertext is not a whole number of blocks.
	bool EncodePack(const std::string &szPlainText, const std::string &szEncryptionKey, std::string &szPack);
	bool DecodePack(const std::string &szPack, const std::string &szEncryptionKey, std::string &szPlainText);

	// Trims `n` bytes where `n` is the value of the last byte. The other
	// padding bytes are not verified; `n` outside 1..16 leaves the data as is.
	void pkcs7_unpad(std::string &szData);

  }; // namespace Codec
}; // namespace Gree

#endif // _greeCodec
