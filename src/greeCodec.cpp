/*
 *  Client interface for local Gree device access
 *
 *  Envelope codec
 *
 *
 *  Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "greeCodec.hpp"
#include "crypt/aes_128_ecb.hpp"
#include "crypt/base64.hpp"
#include <vector>

#ifdef DEBUG
#include <iostream>
#endif


bool Gree::Codec::EncodePack(const std::string &szPlainText, const std::string &szEncryptionKey, std::string &szPack)
{
	szPack.clear();
	if (szEncryptionKey.length() != GREE_KEY_SIZE)
		return false;

	int payloadSize = (int)szPlainText.length();
	std::vector<unsigned char> cEncryptedPayload(payloadSize + 16);
	int encryptedSize = 0;
	if (!aes_128_ecb_encrypt((unsigned char*)szEncryptionKey.c_str(), (unsigned char*)szPlainText.c_str(), payloadSize, cEncryptedPayload.data(), &encryptedSize))
	{
		// encryption failure
		return false;
	}

	szPack = base64_encode(cEncryptedPayload.data(), encryptedSize);
	return true;
}


bool Gree::Codec::DecodePack(const std::string &szPack, const std::string &szEncryptionKey, std::string &szPlainText)
{
	szPlainText.clear();
	if (szEncryptionKey.length() != GREE_KEY_SIZE)
		return false;

	std::vector<unsigned char> cEncryptedPayload;
	if (!base64_decode(szPack, cEncryptedPayload))
	{
#ifdef DEBUG
		std::cout << "dbg: pack is not valid base64\n";
#endif
		return false;
	}

	int payloadSize = (int)cEncryptedPayload.size();
	if ((payloadSize % 16) != 0)
	{
#ifdef DEBUG
		std::cout << "dbg: pack size " << payloadSize << " is not a multiple of the block size\n";
#endif
		return false;
	}
	if (payloadSize == 0)
		return true;

	std::vector<unsigned char> cDecryptedPayload(payloadSize + 16);
	int decryptedSize = 0;
	if (!aes_128_ecb_decrypt((unsigned char*)szEncryptionKey.c_str(), cEncryptedPayload.data(), payloadSize, cDecryptedPayload.data(), &decryptedSize))
		return false;

	szPlainText.assign((char*)cDecryptedPayload.data(), decryptedSize);
	pkcs7_unpad(szPlainText);
	return true;
}


void Gree::Codec::pkcs7_unpad(std::string &szData)
{
	if (szData.empty())
		return;

	uint8_t padding = (uint8_t)szData[szData.length() - 1];
	if ((padding == 0) || (padding > 16))
		return;
	if (padding > szData.length())
		padding = (uint8_t)szData.length();
	szData.erase(szData.length() - padding);
}
