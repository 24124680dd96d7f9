/*
 *  Client interface for local Gree device access
 *
 *  AES-128 ECB encrypt/decrypt module
 *
 *
 *  Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

// Encryption always appends PKCS7 padding (a full block for aligned input).
// Decryption returns the raw blocks, padding removal is left to the caller.

#ifndef _gree_aes_128_ecb
#define _gree_aes_128_ecb

#ifndef USE_MBEDTLS

// select default encryption routines
#define USE_OPENSSL

#endif

#include <cstring>
#include <cstdint>


#ifdef USE_OPENSSL

#include <openssl/evp.h>

namespace Gree {

static bool aes_128_ecb_encrypt(const unsigned char *cEncryptionKey, const unsigned char *cInputBuffer, int inputSize, unsigned char *cOutputBuffer, int *outputSize)
{
	int len;
	*outputSize = 0;

	EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
	if (!ctx)
		return false;

	if (EVP_EncryptInit_ex(ctx, EVP_aes_128_ecb(), nullptr, cEncryptionKey, nullptr) == 1)
	{
		if (EVP_EncryptUpdate(ctx, cOutputBuffer, &len, cInputBuffer, inputSize) == 1)
		{
			*outputSize = len;
			if (EVP_EncryptFinal_ex(ctx, cOutputBuffer + len, &len) == 1)
			{
				*outputSize += len;
				EVP_CIPHER_CTX_free(ctx);
				return true;
			}
		}
	}

	EVP_CIPHER_CTX_free(ctx);
	return false;
}

static bool aes_128_ecb_decrypt(const unsigned char *cEncryptionKey, const unsigned char *cInputBuffer, int inputSize, unsigned char *cOutputBuffer, int *outputSize)
{
	int len;
	*outputSize = 0;

	if ((inputSize % 16) != 0)
		return false;

	EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
	if (!ctx)
		return false;

	if (EVP_DecryptInit_ex(ctx, EVP_aes_128_ecb(), nullptr, cEncryptionKey, nullptr) == 1)
	{
		EVP_CIPHER_CTX_set_padding(ctx, 0);  // caller strips the padding
		if (EVP_DecryptUpdate(ctx, cOutputBuffer, &len, cInputBuffer, inputSize) == 1)
		{
			*outputSize = len;
			if (EVP_DecryptFinal_ex(ctx, cOutputBuffer + len, &len) == 1)
			{
				*outputSize += len;
				EVP_CIPHER_CTX_free(ctx);
				return true;
			}
		}
	}

	EVP_CIPHER_CTX_free(ctx);
	return false;
}

}; // namespace Gree

#endif // USE_OPENSSL


#ifdef USE_MBEDTLS

#include "mbedtls/aes.h"
#include <vector>

namespace Gree {

static bool aes_128_ecb_encrypt(const unsigned char *cEncryptionKey, const unsigned char *cInputBuffer, int inputSize, unsigned char *cOutputBuffer, int *outputSize)
{
	uint8_t padding = 16 - (inputSize % 16);
	int paddedInputSize = inputSize + padding;

	std::vector<unsigned char> cPaddedInput(paddedInputSize);
	if (inputSize > 0)
		memcpy(cPaddedInput.data(), cInputBuffer, inputSize);
	memset(cPaddedInput.data() + inputSize, padding, padding);

	mbedtls_aes_context aes;
	mbedtls_aes_init(&aes);
	if (mbedtls_aes_setkey_enc(&aes, cEncryptionKey, 128) != 0)
	{
		mbedtls_aes_free(&aes);
		return false;
	}
	*outputSize = 0;
	for (int i = 0; i < (paddedInputSize >> 4); ++i)
	{
		mbedtls_aes_crypt_ecb(&aes, MBEDTLS_AES_ENCRYPT, cPaddedInput.data() + (i << 4), cOutputBuffer + (i << 4));
		*outputSize += 16;
	}
	mbedtls_aes_free(&aes);

	return true;
}


static bool aes_128_ecb_decrypt(const unsigned char *cEncryptionKey, const unsigned char *cInputBuffer, int inputSize, unsigned char *cOutputBuffer, int *outputSize)
{
	*outputSize = 0;
	if ((inputSize % 16) != 0)
		return false;

	mbedtls_aes_context aes;
	mbedtls_aes_init(&aes);
	if (mbedtls_aes_setkey_dec(&aes, cEncryptionKey, 128) != 0)
	{
		mbedtls_aes_free(&aes);
		return false;
	}
	for (int i = 0; i < (inputSize >> 4); ++i)
	{
		mbedtls_aes_crypt_ecb(&aes, MBEDTLS_AES_DECRYPT, cInputBuffer + (i << 4), cOutputBuffer + (i << 4));
		*outputSize += 16;
	}
	mbedtls_aes_free(&aes);

	return true;
}

}; // namespace Gree

#endif // USE_MBEDTLS

#endif // _gree_aes_128_ecb
