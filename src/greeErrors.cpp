/*
 *  Client interface for local Gree device access
 *
 *  Error codes shared by all layers
 *
 *
 *  Copyright 2026 - the greepp authors (derived from tuyapp by gordonb3)
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "greeErrors.hpp"


const char* Gree::Error::name(const value error)
{
	switch (error)
	{
		case NONE:
			return "none";
		case CRYPTO:
			return "crypto error";
		case SERIALIZATION:
			return "serialization error";
		case PROTOCOL:
			return "protocol error";
		case IO:
			return "io error";
		case TIMEOUT:
			return "timeout";
		case NOT_FOUND:
			return "not found";
		case NOT_BOUND:
			return "not bound";
		case INVALID_VARIABLE:
			return "invalid variable";
		case INVALID_VALUE:
			return "invalid value";
		case CONFIG:
			return "invalid configuration";
		default:
			break;
	}
	return "unknown error";
}


int Gree::Error::http_status(const value error)
{
	switch (error)
	{
		case NONE:
			return 200;
		case NOT_FOUND:
			return 404;
		case IO:
		case TIMEOUT:
			return 503;
		default:
			break;
	}
	return 400;
}


bool Gree::Error::is_transient(const value error)
{
	return ((error == IO) || (error == TIMEOUT));
}
