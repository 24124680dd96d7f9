/*
 *  Client interface for local Gree device access
 *
 *  Base64 encode/decode module
 *
 *
 *  Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _gree_base64
#define _gree_base64

#ifndef USE_MBEDTLS

// select default encryption routines
#define USE_OPENSSL

#endif

#include <string>
#include <vector>


#ifdef USE_OPENSSL

#include <openssl/evp.h>

namespace Gree {

static std::string base64_encode(const unsigned char *cInputBuffer, int inputSize)
{
	if (inputSize <= 0)
		return std::string();

	std::vector<unsigned char> cOutputBuffer(4 * ((inputSize + 2) / 3) + 1);
	int len = EVP_EncodeBlock(cOutputBuffer.data(), cInputBuffer, inputSize);
	return std::string((char*)cOutputBuffer.data(), len);
}

static bool base64_decode(const std::string &szInput, std::vector<unsigned char> &cOutputBuffer)
{
	cOutputBuffer.clear();
	if (szInput.empty())
		return true;
	if ((szInput.length() % 4) != 0)
		return false;

	cOutputBuffer.resize(3 * (szInput.length() / 4) + 1);
	int len = EVP_DecodeBlock(cOutputBuffer.data(), (const unsigned char*)szInput.c_str(), (int)szInput.length());
	if (len < 0)
		return false;

	// EVP_DecodeBlock does not account for the '=' padding characters
	int padding = 0;
	if (szInput[szInput.length() - 1] == '=')
		padding++;
	if (szInput[szInput.length() - 2] == '=')
		padding++;
	cOutputBuffer.resize(len - padding);
	return true;
}

}; // namespace Gree

#endif // USE_OPENSSL


#ifdef USE_MBEDTLS

#include "mbedtls/base64.h"

namespace Gree {

static std::string base64_encode(const unsigned char *cInputBuffer, int inputSize)
{
	if (inputSize <= 0)
		return std::string();

	std::vector<unsigned char> cOutputBuffer(4 * ((inputSize + 2) / 3) + 1);
	size_t len = 0;
	if (mbedtls_base64_encode(cOutputBuffer.data(), cOutputBuffer.size(), &len, cInputBuffer, inputSize) != 0)
		return std::string();
	return std::string((char*)cOutputBuffer.data(), len);
}

static bool base64_decode(const std::string &szInput, std::vector<unsigned char> &cOutputBuffer)
{
	cOutputBuffer.clear();
	if (szInput.empty())
		return true;
	if ((szInput.length() % 4) != 0)
		return false;

	cOutputBuffer.resize(3 * (szInput.length() / 4) + 1);
	size_t len = 0;
	if (mbedtls_base64_decode(cOutputBuffer.data(), cOutputBuffer.size(), &len, (const unsigned char*)szInput.c_str(), szInput.length()) != 0)
		return false;
	cOutputBuffer.resize(len);
	return true;
}

}; // namespace Gree

#endif // USE_MBEDTLS

#endif // _gree_base64
